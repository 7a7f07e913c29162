/*

test_sendmail.cpp
-----------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE sendmail_test

#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>
#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>
#include <mailq/detail/log.hpp>
#include <mailq/mime/message.hpp>
#include <mailq/transport/sendmail.hpp>


using mailq::sendmail_options;
using mailq::sendmail_transport;


namespace
{

/**
Temporary file removed at the end of the test.
**/
struct temp_file
{
    temp_file() : path(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("mailq-%%%%-%%%%.eml"))
    {
    }

    ~temp_file()
    {
        boost::system::error_code ec;
        boost::filesystem::remove(path, ec);
    }

    std::string read() const
    {
        std::ifstream in(path.string(), std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    boost::filesystem::path path;
};


sendmail_options shell(const std::string& script)
{
    sendmail_options opts;
    opts.path = "/bin/sh";
    opts.arguments = {"-c", script};
    return opts;
}

} // namespace


BOOST_AUTO_TEST_CASE(default_options)
{
    sendmail_transport transp;
    BOOST_CHECK_EQUAL(transp.options().path, "/usr/sbin/sendmail");
    BOOST_REQUIRE_EQUAL(transp.options().arguments.size(), 2u);
    BOOST_CHECK_EQUAL(transp.options().arguments[0], "-t");
    BOOST_CHECK_EQUAL(transp.options().arguments[1], "-i");
}


BOOST_AUTO_TEST_CASE(compose_payload)
{
    sendmail_transport transp;
    BOOST_CHECK_EQUAL(transp.compose("b@x.com", "Hi", "Hello", "X-Mailer: MailQueue 0.1\r\nFrom: a@x.com"),
        "To: b@x.com\r\nSubject: Hi\r\nX-Mailer: MailQueue 0.1\r\nFrom: a@x.com\r\n\r\nHello\r\n");
    BOOST_CHECK_EQUAL(transp.compose("b@x.com", "Hi", "Hello", ""),
        "To: b@x.com\r\nSubject: Hi\r\n\r\nHello\r\n");

    sendmail_options opts;
    opts.line_ending = "\n";
    sendmail_transport unix_transp(opts);
    BOOST_CHECK_EQUAL(unix_transp.compose("b@x.com", "Hi", "Hello", ""), "To: b@x.com\nSubject: Hi\n\nHello\n");
}


BOOST_AUTO_TEST_CASE(payload_written_to_program)
{
    temp_file out;
    sendmail_transport transp(shell("cat > '" + out.path.string() + "'"));

    BOOST_CHECK(transp.send("b@x.com", "Hi", "Hello", "From: a@x.com"));
    BOOST_CHECK_EQUAL(out.read(), "To: b@x.com\r\nSubject: Hi\r\nFrom: a@x.com\r\n\r\nHello\r\n");
}


BOOST_AUTO_TEST_CASE(non_zero_exit_fails)
{
    sendmail_transport transp(shell("cat > /dev/null; exit 3"));
    BOOST_CHECK(!transp.send("b@x.com", "Hi", "Hello", ""));
}


BOOST_AUTO_TEST_CASE(program_leaving_input_unread_fails)
{
    sendmail_transport transp(shell("exit 75"));
    const std::string large_body(1 << 20, 'x');

    BOOST_CHECK(!transp.send("b@x.com", "Hi", large_body, ""));
    BOOST_CHECK(!transp.send("c@x.com", "Hi", "short", ""));
}


BOOST_AUTO_TEST_CASE(serial_send_continues_after_unread_input)
{
    temp_file out;
    sendmail_transport transp(shell("case \"$(head -n 1)\" in *b@x.com*) exit 75;; esac; cat >> '" +
        out.path.string() + "'"));

    mailq::message msg;
    BOOST_REQUIRE(msg.add_recipient("b@x.com"));
    BOOST_REQUIRE(msg.add_recipient("c@x.com"));
    msg.subject("Hi");
    msg.content(std::string(1 << 20, 'x'));

    BOOST_CHECK_EQUAL(msg.send(transp), 1u);
    BOOST_REQUIRE_EQUAL(msg.errors().size(), 1u);
    BOOST_CHECK_EQUAL(msg.errors()[0], "Unable to send to b@x.com");
    BOOST_CHECK(!out.read().empty());
}


BOOST_AUTO_TEST_CASE(line_break_in_subject_refused)
{
    temp_file out;
    sendmail_transport transp(shell("cat > '" + out.path.string() + "'"));

    BOOST_CHECK(!transp.send("b@x.com", "Hi\r\nBcc: spy@evil.com", "Hello", ""));
    BOOST_CHECK(!transp.send("b@x.com\nBcc: spy@evil.com", "Hi", "Hello", ""));
    BOOST_CHECK(!boost::filesystem::exists(out.path));
}


BOOST_AUTO_TEST_CASE(missing_program_fails)
{
    std::vector<std::string> lines;
    mailq::log::set_sink([&lines](mailq::log::level, std::string_view text) { lines.emplace_back(text); });

    sendmail_options opts;
    opts.path = "/nonexistent/mailq/sendmail";
    sendmail_transport transp(opts);
    BOOST_CHECK(!transp.send("b@x.com", "Hi", "Hello", ""));
    BOOST_CHECK(!lines.empty());

    mailq::log::set_sink(nullptr);
}


BOOST_AUTO_TEST_CASE(message_sent_through_program)
{
    temp_file out;
    sendmail_transport transp(shell("cat >> '" + out.path.string() + "'"));

    mailq::message msg;
    BOOST_REQUIRE(msg.from("a@x.com"));
    BOOST_REQUIRE(msg.add_recipient("b@x.com"));
    BOOST_REQUIRE(msg.add_recipient("c@x.com"));
    msg.subject("Hi");
    msg.content("Hello");

    BOOST_CHECK_EQUAL(msg.send(transp), 0u);
    const std::string expected_one = "To: b@x.com\r\nSubject: Hi\r\nX-Mailer: MailQueue 0.1\r\nFrom: a@x.com\r\n\r\nHello\r\n";
    const std::string expected_two = "To: c@x.com\r\nSubject: Hi\r\nX-Mailer: MailQueue 0.1\r\nFrom: a@x.com\r\n\r\nHello\r\n";
    BOOST_CHECK_EQUAL(out.read(), expected_one + expected_two);
}
