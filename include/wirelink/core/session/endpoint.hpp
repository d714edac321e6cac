#pragma once

#include <cstdint>
#include <string>
#include <utility>


namespace wirelink::core::session {

// Target of a session: where to connect and how many retries a failed
// connection may consume. Fixed for the lifetime of a Controller.
class Endpoint {
public:
    Endpoint(std::string address, std::uint32_t max_attempts)
        : address_(std::move(address))
        , max_attempts_(max_attempts)
    {}

    [[nodiscard]]
    const std::string& address() const noexcept { return address_; }

    [[nodiscard]]
    std::uint32_t max_attempts() const noexcept { return max_attempts_; }

private:
    std::string address_;
    std::uint32_t max_attempts_;
};

} // namespace wirelink::core::session
