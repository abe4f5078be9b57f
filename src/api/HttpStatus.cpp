// clang-format off
#include <climits>
#include <httplib.h>
// clang-format on

#include <fmt/format.h>

#include "HttpStatus.hpp"

namespace ChunkXfer {

int toHttpStatus(const absl::Status& status) {
    switch (status.code()) {
        case absl::StatusCode::kOk:
            return httplib::StatusCode::OK_200;
        case absl::StatusCode::kInvalidArgument:
            return httplib::StatusCode::BadRequest_400;
        default:
            return httplib::StatusCode::InternalServerError_500;
    }
}

absl::Status fromHttpResponse(int httpStatus, std::string_view body) {
    switch (httpStatus) {
        case httplib::StatusCode::OK_200:
            return absl::OkStatus();
        case httplib::StatusCode::BadRequest_400:
            return absl::InvalidArgumentError(body);
        default:
            return absl::InternalError(
                fmt::format("HTTP {}: {}", httpStatus, body));
    }
}

}  // namespace ChunkXfer
