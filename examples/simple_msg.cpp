/*

simple_msg.cpp
--------------

Composes a simple message and hands it to the local sendmail program.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <mailq/mime/message.hpp>
#include <mailq/transport/sendmail.hpp>


using mailq::message;
using mailq::result;
using mailq::sendmail_transport;
using std::cout;
using std::endl;


result<void> compose(message& msg)
{
    MAILQ_TRY(msg.from("mailq@example.com"));// set the correct sender address
    MAILQ_TRY(msg.add_recipient("mailq library", "mailq@example.com"));// set the correct recipent name and address
    msg.subject("simple message");
    msg.content("Hello, World!");
    return {};
}


int main()
{
    message msg;
    auto composed = compose(msg);
    if (!composed)
    {
        cout << composed.error().message << " " << composed.error().details << endl;
        return EXIT_FAILURE;
    }

    cout << msg.format();

    sendmail_transport transp;
    if (msg.send(transp) != 0)
    {
        for (const auto& err : msg.errors())
            cout << err << endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
