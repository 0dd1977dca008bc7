#pragma once
#include <chrono>
#include <string>
#include <cpr/cpr.h>

#include "llm_dispatch/CallTypes.hpp"
#include "llm_dispatch/CancellationToken.hpp"

namespace llm_dispatch {

// Maps a non-200 HTTP status (and its body) to a provider error kind.
ProviderErrorKind classify_http_status(long status_code, const std::string& body);

// Turns a finished cpr transfer into a failed reply. Only for non-200 or
// transport-level errors; a 200 is parsed by the client itself.
ProviderReply classify_response(const cpr::Response& r, const CancellationToken& cancel);

// Aborts the transfer as soon as the token fires.
cpr::ProgressCallback cancel_progress(const CancellationToken& cancel);

// Milliseconds left until `deadline`, never below 1 so cpr does not treat it as "no timeout".
long remaining_ms(TimePoint deadline);

// Pulls a short message out of a provider's JSON error body.
std::string extract_error_message(const std::string& body);

}
