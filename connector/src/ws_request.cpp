/**
 * @file ws_request.cpp
 * @brief Request descriptor implementation
 */

#include "wsconn/connector/ws_request.hpp"

#include <algorithm>

namespace wsconn::connector {

Part Part::text(std::string_view value) {
    return Part("text/plain; charset=UTF-8",
                Content(std::vector<uint8_t>(value.begin(), value.end())));
}

PostRequest PostRequest::with_part(std::string name, Part part) const {
    PostRequest copy(*this);
    auto it = std::find_if(copy.parts_.begin(), copy.parts_.end(),
                           [&](const auto& entry) { return entry.first == name; });
    if (it != copy.parts_.end()) {
        it->second = std::move(part);
    } else {
        copy.parts_.emplace_back(std::move(name), std::move(part));
    }
    return copy;
}

const Part* PostRequest::part(std::string_view name) const noexcept {
    for (const auto& [key, value] : parts_) {
        if (key == name) {
            return &value;
        }
    }
    return nullptr;
}

}  // namespace wsconn::connector
