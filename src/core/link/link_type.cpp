#include "devicelink/core/link/link_type.hpp"

namespace devicelink {

    const char* toString(LinkType type) noexcept {
        switch (type) {
        case LinkType::Cbs:             return "Cbs";
        case LinkType::Events:          return "Events";
        case LinkType::C2D:             return "C2D";
        case LinkType::ModuleMessages:  return "ModuleMessages";
        case LinkType::MethodSending:   return "MethodSending";
        case LinkType::MethodReceiving: return "MethodReceiving";
        case LinkType::TwinSending:     return "TwinSending";
        case LinkType::TwinReceiving:   return "TwinReceiving";
        }
        return "Unknown";
    }

}
