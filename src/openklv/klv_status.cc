#include "openklv/klv_status.h"

namespace openklv {

const char*
klv_status_name(KlvStatus status) noexcept
{
    switch (status) {
    case KlvStatus::Ok: return "ok";
    case KlvStatus::UnexpectedEnd: return "unexpected_end";
    case KlvStatus::InvalidLength: return "invalid_length";
    case KlvStatus::Overflow: return "overflow";
    case KlvStatus::Malformed: return "malformed";
    case KlvStatus::NonMinimal: return "non_minimal";
    case KlvStatus::DuplicateTag: return "duplicate_tag";
    case KlvStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}

}  // namespace openklv
