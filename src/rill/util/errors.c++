// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "errors.h"

namespace rill {

namespace {
constexpr auto ERROR_PREFIX_RILL = "rill."_kj;

struct KnownPrefix {
  kj::StringPtr prefix;
  ErrorType type;
};

// Order matters only in that no prefix in this list is a prefix of another.
const KnownPrefix KNOWN_PREFIXES[] = {
  {RILL_ERROR_TypeError ": "_kj, ErrorType::TYPE_ERROR},
  {RILL_ERROR_RangeError ": "_kj, ErrorType::RANGE_ERROR},
  {RILL_ERROR_Error ": "_kj, ErrorType::ERROR},
  {RILL_ERROR_AbortError ": "_kj, ErrorType::ABORT_ERROR},
  {RILL_ERROR_TimeoutError ": "_kj, ErrorType::TIMEOUT_ERROR},
};
}  // namespace

kj::StringPtr stripRequirementPrefix(kj::StringPtr description) {
  // KJ_REQUIRE() failures are described as "expected <cond>; <message>", where the message may
  // itself be annotated with the expression that produced it. Everything before our prefix is
  // noise.
  KJ_IF_SOME(i, description.find(ERROR_PREFIX_RILL)) {
    return description.slice(i);
  }
  return description;
}

ErrorType errorTypeOf(const kj::Exception& exception) {
  auto description = stripRequirementPrefix(exception.getDescription());
  for (auto& known: KNOWN_PREFIXES) {
    if (description.startsWith(known.prefix)) {
      return known.type;
    }
  }
  return ErrorType::UNKNOWN;
}

kj::StringPtr stripErrorPrefix(kj::StringPtr description) {
  description = stripRequirementPrefix(description);
  for (auto& known: KNOWN_PREFIXES) {
    if (description.startsWith(known.prefix)) {
      return description.slice(known.prefix.size());
    }
  }
  return description;
}

kj::Exception abortError(kj::StringPtr message) {
  return RILL_KJ_EXCEPTION(DISCONNECTED, AbortError, message);
}

kj::StringPtr KJ_STRINGIFY(ErrorType type) {
  switch (type) {
    case ErrorType::UNKNOWN:
      return "UNKNOWN"_kj;
    case ErrorType::ERROR:
      return "Error"_kj;
    case ErrorType::TYPE_ERROR:
      return "TypeError"_kj;
    case ErrorType::RANGE_ERROR:
      return "RangeError"_kj;
    case ErrorType::ABORT_ERROR:
      return "AbortError"_kj;
    case ErrorType::TIMEOUT_ERROR:
      return "TimeoutError"_kj;
  }
  KJ_UNREACHABLE;
}

kj::Exception reasonOrAbortError(kj::Maybe<kj::Exception> reason) {
  KJ_IF_SOME(r, reason) {
    return kj::mv(r);
  }
  return abortError();
}

}  // namespace rill
