// Copyright 2025 The Firehose Client Authors
// SPDX-License-Identifier: Apache-2.0

#include "payload.hpp"

#include <absl/strings/str_cat.h>

namespace firehose {

static constexpr std::string_view kTypeUrlPrefix{"type.googleapis.com/"};

std::string_view type_name(std::string_view type_url) {
    const auto slash_pos = type_url.rfind('/');
    if (slash_pos == std::string_view::npos) {
        return type_url;
    }
    return type_url.substr(slash_pos + 1);
}

std::string make_type_url(std::string_view message_name) {
    return absl::StrCat(absl::string_view{kTypeUrlPrefix.data(), kTypeUrlPrefix.size()},
                        absl::string_view{message_name.data(), message_name.size()});
}

std::ostream& operator<<(std::ostream& out, const Payload& payload) {
    out << "type=" << type_name(payload.type_url) << " size=" << payload.value.size();
    return out;
}

}  // namespace firehose
