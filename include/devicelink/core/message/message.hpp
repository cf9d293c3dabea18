/**
 * @file message.hpp
 * @brief Message envelope forwarded onto links.
 *
 * The core never interprets the body; it only stamps a few system property keys
 * before handing the message to a sending link.
 */
#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace devicelink {

    /**
     * @brief Well-known system property keys.
     */
    namespace SystemProperties {
        inline constexpr const char* To            = "to";
        inline constexpr const char* CorrelationId = "cid";
        inline constexpr const char* InputName     = "inputName";
    }

    /// Application property holding the name of an invoked direct method.
    inline constexpr const char* MethodNamePropertyKey = "IoThub-methodname";

    /**
     * @class Message
     * @brief Mutable envelope: opaque body plus system and application properties.
     */
    class Message {
    public:
        using Properties = std::unordered_map<std::string, std::string>;

        Message() = default;
        explicit Message(std::vector<uint8_t> body) : body_(std::move(body)) {}

        const std::vector<uint8_t>& body() const { return body_; }
        void setBody(std::vector<uint8_t> body) { body_ = std::move(body); }

        /**
         * @brief System properties (routing address, correlation id, input name, ...).
         */
        Properties& systemProperties() { return systemProperties_; }
        const Properties& systemProperties() const { return systemProperties_; }

        /**
         * @brief Application properties set by the sender.
         */
        Properties& properties() { return properties_; }
        const Properties& properties() const { return properties_; }

    private:
        std::vector<uint8_t> body_;
        Properties           systemProperties_;
        Properties           properties_;
    };

}
