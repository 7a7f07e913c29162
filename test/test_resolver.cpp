/*

test_resolver.cpp
-----------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE resolver_test

#include <memory>
#include <boost/test/unit_test.hpp>
#include <mailq/mime/address_validator.hpp>
#include <mailq/net/domain_resolver.hpp>


using mailq::net::dns_options;
using mailq::net::dns_resolver;


BOOST_AUTO_TEST_CASE(default_options_check_both)
{
    dns_resolver resolver;
    BOOST_CHECK(resolver.options().check_mx);
    BOOST_CHECK(resolver.options().check_a);
}


BOOST_AUTO_TEST_CASE(address_record_of_localhost)
{
    dns_options opts;
    opts.check_mx = false;
    dns_resolver resolver(opts);
    BOOST_CHECK(resolver.has_address("localhost"));
    BOOST_CHECK(resolver.has_mx_or_a("localhost"));
}


BOOST_AUTO_TEST_CASE(nothing_checked_nothing_found)
{
    dns_options opts;
    opts.check_mx = false;
    opts.check_a = false;
    dns_resolver resolver(opts);
    BOOST_CHECK(!resolver.has_mx_or_a("localhost"));
}


BOOST_AUTO_TEST_CASE(empty_domain_rejected)
{
    dns_resolver resolver;
    BOOST_CHECK(!resolver.has_mx_or_a(""));
}


BOOST_AUTO_TEST_CASE(reserved_domain_not_found)
{
    dns_options opts;
    opts.check_mx = false;
    dns_resolver resolver(opts);
    BOOST_CHECK(!resolver.has_address("mailq.invalid"));
}


BOOST_AUTO_TEST_CASE(validator_with_dns)
{
    dns_options opts;
    opts.check_mx = false;
    mailq::address_validator val(std::make_shared<dns_resolver>(opts));
    BOOST_CHECK(val.validate("root@localhost"));
    BOOST_CHECK(!val.validate("root@mailq.invalid"));
    BOOST_CHECK(!val.validate("root..x@localhost"));
}
