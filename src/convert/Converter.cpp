#include "convert/Converter.hpp"

namespace mds::convert {

std::string_view to_string(const Direction d) {
    switch (d) {
    case Direction::ToRemote: return "to-remote";
    case Direction::ToLocal: return "to-local";
    }
    return "unknown";
}

}
