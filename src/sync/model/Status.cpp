#include "sync/model/Status.hpp"

using namespace dw::sync::model;

std::string dw::sync::model::to_string(const Status s) {
    switch (s) {
    case Status::MATCH_LOCAL: return "MATCH_LOCAL";
    case Status::MATCH_REFERENCE: return "MATCH_REFERENCE";
    case Status::MATCH_LAST_DEPLOY: return "MATCH_LAST_DEPLOY";
    case Status::DIFF_HASH: return "DIFF_HASH";
    case Status::MISSING: return "MISSING";
    case Status::MATCH_SIZE: return "MATCH_SIZE";
    case Status::DIFF_SIZE: return "DIFF_SIZE";
    case Status::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string dw::sync::model::to_string(const TimeOrder o) {
    switch (o) {
    case TimeOrder::Newer: return "newer";
    case TimeOrder::Older: return "older";
    case TimeOrder::Equal: return "equal";
    case TimeOrder::Unknown: return "unknown";
    }
    return "unknown";
}

char dw::sync::model::symbol(const TimeOrder o) {
    switch (o) {
    case TimeOrder::Newer: return '>';
    case TimeOrder::Older: return '<';
    case TimeOrder::Equal: return '=';
    case TimeOrder::Unknown: return '?';
    }
    return '?';
}

bool dw::sync::model::isSizeOnly(const Status s) {
    return s == Status::MATCH_SIZE || s == Status::DIFF_SIZE || s == Status::UNKNOWN;
}
