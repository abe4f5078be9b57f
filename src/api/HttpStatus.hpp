#pragma once

#include <absl/status/status.h>

#include <string_view>

namespace ChunkXfer {

// InvalidArgument is the only client error, everything else is ours.
int toHttpStatus(const absl::Status& status);

// Turns a non-200 response back into a status, keeping the server's message.
absl::Status fromHttpResponse(int httpStatus, std::string_view body);

}  // namespace ChunkXfer
