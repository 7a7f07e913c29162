/*

serial_send.cpp
---------------

Sends a message with carbon copies to each recipient separately and reports the recipients that failed.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <string_view>
#include <mailq/detail/log.hpp>
#include <mailq/mime/message.hpp>
#include <mailq/mime/recipient.hpp>
#include <mailq/mime/recipient_list.hpp>
#include <mailq/transport/transport.hpp>


using mailq::message;
using mailq::recipient;
using mailq::recipient_list;
using mailq::result;
using std::cout;
using std::endl;
using std::string_view;


result<void> compose(message& msg)
{
    MAILQ_TRY(msg.from("newsletter@example.com"));
    MAILQ_TRY(msg.reply_to("support@example.com"));
    MAILQ_TRY(msg.add_recipient("Alice", "alice@example.com"));
    MAILQ_TRY(msg.add_recipient("bob@example.com"));
    MAILQ_TRY(msg.add_recipient("Carol", "carol@example.org"));

    recipient_list copies;
    auto archive = recipient::create("Archive", "archive@example.com");
    if (!archive)
        return std::unexpected(archive.error());
    MAILQ_TRY(copies.add(*archive));
    MAILQ_TRY(msg.cc(copies));

    msg.subject("serial message");
    msg.content("One delivery per recipient.");
    return {};
}


int main()
{
    mailq::log::set_level(mailq::log::level::debug);

    message msg;
    auto composed = compose(msg);
    if (!composed)
    {
        cout << composed.error().message << " " << composed.error().details << endl;
        return EXIT_FAILURE;
    }

    // the callback stands in for a real delivery, rejecting one domain
    mailq::function_transport transp([](string_view rcpt, string_view subject, string_view, string_view headers)
        {
            cout << "-> " << rcpt << " [" << subject << "]" << endl << headers << endl;
            return rcpt.find("example.org") == string_view::npos;
        });

    const std::size_t failed = msg.send(transp);
    cout << failed << " delivery(ies) failed" << endl;
    for (const auto& err : msg.errors())
        cout << err << endl;
    return failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
