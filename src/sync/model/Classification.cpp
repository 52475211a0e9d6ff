#include "sync/model/Classification.hpp"
#include "util/timestamp.hpp"

#include <fmt/core.h>

using namespace dw::sync::model;
using namespace dw::util;

namespace {

std::string displayOrNA(const std::optional<std::time_t>& ts) {
    return ts ? timestampToDisplay(*ts) : "N/A";
}

}

std::string Classification::details() const {
    switch (status) {
    case Status::MISSING:
        return "";
    case Status::MATCH_SIZE:
        return fmt::format("Size: {}", *local_size);
    case Status::DIFF_SIZE:
        return fmt::format("Local: {} vs Remote: {} (possible line-ending difference)", *local_size, *remote_size);
    case Status::UNKNOWN:
        return "Cannot compare size";
    default:
        return fmt::format("[L: {} {} R: {}]", displayOrNA(local_timestamp), symbol(order), displayOrNA(remote_timestamp));
    }
}
