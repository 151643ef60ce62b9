#include "device_registry.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "logging/logger.hpp"

namespace pixoogate {
namespace registry {

namespace {
std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
}  // namespace

DeviceRegistry::DeviceRegistry(std::vector<device::DeviceContext> devices) : devices_(std::move(devices)) {
    for (size_t i = 0; i < devices_.size(); ++i) {
        auto &ctx = devices_[i];

        // No discovery: AUTO settles on PIXOO
        ctx.device_type = device::normalize_device_type(ctx.device_type);
        if (ctx.device_type == device::DeviceType::AUTO) {
            ctx.device_type = device::DeviceType::PIXOO;
        }

        if (ctx.device_type == device::DeviceType::TIME_GATE && ctx.screen_size < device::kTimeGateMinScreenSize) {
            ctx.screen_size = device::kTimeGateMinScreenSize;
        }

        auto lowered = to_lower(ctx.key);
        if (key_to_index_.count(lowered) > 0) {
            LOG_WARN("[Registry] Duplicate key '" << ctx.key << "', keeping the first entry");
        } else {
            key_to_index_[lowered] = i;
        }

        auto host_it = host_to_index_.find(ctx.host);
        if (host_it != host_to_index_.end()) {
            LOG_WARN("[Registry] Host " << ctx.host << " is shared by '" << devices_[host_it->second].key << "' and '"
                                        << ctx.key << "'; host lookups resolve to '" << ctx.key << "'");
        }
        host_to_index_[ctx.host] = i;

        LOG_INFO("[Registry] Registered: " << ctx.key << " -> " << ctx.host << " ("
                                           << device::device_type_to_string(ctx.device_type) << ", "
                                           << ctx.screen_size << "px)");
    }
}

const device::DeviceContext *DeviceRegistry::select(const std::optional<std::string> &key,
                                                    const std::optional<std::string> &host) const {
    if (key.has_value() && !key->empty()) {
        return get_device(*key);
    }
    if (host.has_value() && !host->empty()) {
        return get_device_by_host(*host);
    }
    return default_device();
}

const device::DeviceContext *DeviceRegistry::get_device(const std::string &key) const {
    auto it = key_to_index_.find(to_lower(key));
    if (it == key_to_index_.end()) {
        return nullptr;
    }
    return &devices_[it->second];
}

const device::DeviceContext *DeviceRegistry::get_device_by_host(const std::string &host) const {
    auto it = host_to_index_.find(host);
    if (it == host_to_index_.end()) {
        return nullptr;
    }
    return &devices_[it->second];
}

const device::DeviceContext *DeviceRegistry::default_device() const {
    return devices_.empty() ? nullptr : &devices_.front();
}

std::vector<std::string> DeviceRegistry::keys() const {
    std::vector<std::string> result;
    result.reserve(devices_.size());
    for (const auto &ctx : devices_) {
        result.push_back(ctx.key);
    }
    return result;
}

std::vector<std::string> DeviceRegistry::hosts() const {
    std::vector<std::string> result;
    result.reserve(devices_.size());
    for (const auto &ctx : devices_) {
        result.push_back(ctx.host);
    }
    return result;
}

bool DeviceRegistry::attach_session(const std::string &key, std::shared_ptr<device::IPixooSession> session) {
    auto it = key_to_index_.find(to_lower(key));
    if (it == key_to_index_.end()) {
        return false;
    }
    devices_[it->second].session = std::move(session);
    return true;
}

}  // namespace registry
}  // namespace pixoogate
