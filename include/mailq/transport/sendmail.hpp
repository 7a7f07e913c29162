/*

sendmail.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <cerrno>
#include <csignal>
#include <ctime>
#include <pthread.h>
#include <signal.h>
#include <boost/process/args.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exception.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>
#include <boost/process/pipe.hpp>
#include <mailq/detail/ascii.hpp>
#include <mailq/detail/log.hpp>
#include <mailq/transport/transport.hpp>
#include <mailq/export.hpp>

namespace mailq
{

namespace detail
{

/**
Blocking `SIGPIPE` in the calling thread for the lifetime of the object.

A `SIGPIPE` raised while blocked is consumed before the previous mask is restored, so writes to a closed pipe fail
with `EPIPE` only.
**/
class sigpipe_block
{
public:
    sigpipe_block()
    {
        ::sigemptyset(&pipe_mask_);
        ::sigaddset(&pipe_mask_, SIGPIPE);

        sigset_t pending;
        ::sigemptyset(&pending);
        was_pending_ = ::sigpending(&pending) == 0 && ::sigismember(&pending, SIGPIPE) == 1;
        blocked_ = ::pthread_sigmask(SIG_BLOCK, &pipe_mask_, &old_mask_) == 0;
    }

    sigpipe_block(const sigpipe_block&) = delete;

    sigpipe_block& operator=(const sigpipe_block&) = delete;

    ~sigpipe_block()
    {
        if (!blocked_)
            return;

        if (!was_pending_)
        {
            sigset_t pending;
            ::sigemptyset(&pending);
            if (::sigpending(&pending) == 0 && ::sigismember(&pending, SIGPIPE) == 1)
            {
                const timespec no_wait{0, 0};
                while (::sigtimedwait(&pipe_mask_, nullptr, &no_wait) == -1 && errno == EINTR)
                    ;
            }
        }
        ::pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    }

private:
    sigset_t pipe_mask_;
    sigset_t old_mask_;
    bool was_pending_ = false;
    bool blocked_ = false;
};

} // namespace detail


/**
Options of the sendmail transport.
**/
struct sendmail_options
{
    /**
    Program reading the mail from the standard input.
    **/
    std::string path = "/usr/sbin/sendmail";

    /**
    Program arguments; `-t` takes the recipients from the headers, `-i` keeps lone dots.
    **/
    std::vector<std::string> arguments = {"-t", "-i"};

    /**
    Line ending of the lines written by the transport itself.
    **/
    std::string line_ending = "\r\n";
};


/**
Transport piping each mail into a sendmail compatible program.
**/
class MAILQ_EXPORT sendmail_transport : public transport
{
public:
    explicit sendmail_transport(sendmail_options options = sendmail_options{}) : options_(std::move(options))
    {
    }

    /**
    Running the program once for the mail.

    A program exiting before it has read the whole mail fails the delivery instead of raising `SIGPIPE`.

    @return True if the program read the mail and exited with zero status; false also for a recipient line or a
            subject holding a control character.
    **/
    bool send(std::string_view recipients, std::string_view subject, std::string_view body,
        std::string_view headers) override
    {
        if (!detail::is_valid_header_value(recipients) || !detail::is_valid_header_value(subject))
        {
            MAILQ_WARN("Refusing to send to `" + options_.path +
                "`: control character in the recipients or the subject.");
            return false;
        }

        const std::string payload = compose(recipients, subject, body, headers);
        namespace bp = boost::process;

        try
        {
            bp::opstream input;
            bp::child proc(bp::exe = options_.path, bp::args = options_.arguments,
                bp::std_in < input, bp::std_out > bp::null);

            bool written = false;
            {
                detail::sigpipe_block block;
                input.write(payload.data(), static_cast<std::streamsize>(payload.size()));
                input.flush();
                written = !input.fail();
                // the stream close() only flushes; closing the pipe ends the input of the program
                input.pipe().close();
            }
            proc.wait();

            if (!written)
            {
                MAILQ_WARN("`" + options_.path + "` did not read the whole mail for " + std::string(recipients) +
                    ", exit status " + std::to_string(proc.exit_code()) + ".");
                return false;
            }
            if (proc.exit_code() != 0)
            {
                MAILQ_WARN("`" + options_.path + "` exited with status " + std::to_string(proc.exit_code()) +
                    " for " + std::string(recipients) + ".");
                return false;
            }
            return true;
        }
        catch (const bp::process_error& exc)
        {
            MAILQ_ERROR("Running `" + options_.path + "` failed: " + exc.what());
            return false;
        }
    }

    /**
    Building the text written to the program: To and Subject lines, the header block, an empty line and the body.
    **/
    std::string compose(std::string_view recipients, std::string_view subject, std::string_view body,
        std::string_view headers) const
    {
        const std::string& eol = options_.line_ending;
        std::string out;
        out.reserve(recipients.size() + subject.size() + body.size() + headers.size() + 32);

        out += "To: ";
        out += recipients;
        out += eol;
        out += "Subject: ";
        out += subject;
        out += eol;
        if (!headers.empty())
        {
            out += headers;
            out += eol;
        }
        out += eol;
        out += body;
        out += eol;
        return out;
    }

    const sendmail_options& options() const { return options_; }

private:
    sendmail_options options_;
};

} // namespace mailq
