#pragma once

#include <memory>
#include <string>
#include <utility>

#include <libetcdgw/config.hpp>

#include "client.hpp"
#include "codecs.hpp"
#include "curl_transport.hpp"
#include "database.hpp"
#include "errors.hpp"
#include "key_range.hpp"
#include "lease.hpp"
#include "pmap.hpp"
#include "slots.hpp"
#include "types.hpp"
#include "util.hpp"
#include "watch.hpp"

namespace libetcdgw {

// Connects to the gateway at `url`, e.g. "http://localhost:2379".
inline std::shared_ptr<Client> open(std::string url, const ClientOptions &options = {})
{
    auto [protocol, address] = util::split_url(url);

    if (address.empty())
        throw InvalidAddress("no address in URL '" + url + "'");

    if (protocol != "http" && protocol != "https")
        throw InvalidAddress("protocol not supported: " + protocol);

    while (!url.empty() && url.back() == '/')
        url.pop_back();

    return std::make_shared<Client>(std::make_shared<CurlTransport>(std::move(url), options.connect_timeout), options);
}

} // namespace libetcdgw
