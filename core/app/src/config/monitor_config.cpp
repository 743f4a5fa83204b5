#include "futmon/config/monitor_config.hpp"

#include "futmon/gateway/endpoint.hpp"

namespace futmon {

std::string Credentials::maskedKey() const {
  if (api_key.size() <= 4) {
    return "****";
  }
  return "****" + api_key.substr(api_key.size() - 4);
}

std::string ExchangeConfig::resolvedBaseUrl() const {
  if (!base_url.empty()) {
    return base_url;
  }
  return use_testnet ? kTestnetBaseUrl : kMainnetBaseUrl;
}

}  // namespace futmon
