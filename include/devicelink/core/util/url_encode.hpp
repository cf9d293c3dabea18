/**
 * @file url_encode.hpp
 * @brief Percent-encoding helpers for device and module addresses.
 */
#pragma once
#include <format>
#include <string>
#include <string_view>

#include "devicelink/core/auth/ClientIdentity.hpp"

namespace devicelink {

    /**
     * @brief Percent-encode a single path segment.
     *
     * RFC 3986 unreserved characters (ALPHA, DIGIT, '-', '.', '_', '~') are kept,
     * every other byte becomes "%XX" with upper-case hex digits.
     *
     * @param segment Raw segment
     * @return Encoded segment
     */
    inline std::string urlEncode(std::string_view segment)
    {
        std::string out;
        out.reserve(segment.size() * 3);
        for (const char c : segment) {
            const auto b = static_cast<unsigned char>(c);
            const bool unreserved =
                (b >= 'A' && b <= 'Z') || (b >= 'a' && b <= 'z') || (b >= '0' && b <= '9') ||
                b == '-' || b == '.' || b == '_' || b == '~';
            if (unreserved) {
                out += c;
            }
            else {
                out += std::format("%{:02X}", b);
            }
        }
        return out;
    }

    /**
     * @brief Routing address of a client: "/devices/{d}" or "/devices/{d}/modules/{m}".
     * @param identity Device or module identity
     * @return Address with both segments percent-encoded
     */
    inline std::string deviceAddress(const ClientIdentity& identity)
    {
        if (identity.moduleId) {
            return std::format("/devices/{}/modules/{}",
                urlEncode(identity.deviceId), urlEncode(*identity.moduleId));
        }
        return std::format("/devices/{}", urlEncode(identity.deviceId));
    }

}
