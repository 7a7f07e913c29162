#pragma once

#include <mailq/export.hpp>
#include <mailq/version.hpp>
#include <mailq/macros.hpp>
#include <mailq/error.hpp>

#include <mailq/detail/log.hpp>

#include <mailq/net/domain_resolver.hpp>

#include <mailq/mime/address_validator.hpp>
#include <mailq/mime/recipient.hpp>
#include <mailq/mime/recipient_list.hpp>
#include <mailq/mime/header.hpp>
#include <mailq/mime/header_list.hpp>
#include <mailq/mime/message.hpp>

#include <mailq/transport/transport.hpp>
#include <mailq/transport/sendmail.hpp>
