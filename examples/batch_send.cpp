/*

batch_send.cpp
--------------

Checks the recipient domains in DNS and sends one mail to all recipients through sendmail.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <memory>
#include <mailq/import.hpp>


using mailq::message;
using mailq::message_options;
using mailq::net::dns_resolver;
using mailq::sendmail_transport;
using std::cout;
using std::endl;


int main()
{
    message_options opts;
    opts.resolver = std::make_shared<dns_resolver>();
    message msg(opts);

    // addresses of domains without MX or A records are rejected
    for (const char* addr : {"postmaster@gmail.com", "nobody@mailq.invalid"})
    {
        auto added = msg.add_recipient(addr);
        if (!added)
            cout << added.error().details << endl;
    }
    msg.subject("batch message");
    msg.content("One delivery for all recipients.");

    sendmail_transport transp;
    if (msg.batch_send(transp) != 0)
    {
        cout << msg.errors().front() << endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
