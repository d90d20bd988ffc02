// Copyright 2026 The Coral Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#ifndef CORAL_FRONTEND_POS_H_
#define CORAL_FRONTEND_POS_H_

#include <cstdint>
#include <ostream>
#include <string>
#include <tuple>
#include <utility>

#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "coral/common/logging/logging.h"

namespace coral {

// A point in a source file. Line and column are zero-based; the text forms
// are one-based, the way editors number them.
//
// Positions are only ordered against positions in the same file.
class Pos {
 public:
  Pos() : lineno_(0), colno_(0) {}
  Pos(std::string filename, int64_t lineno, int64_t colno)
      : filename_(std::move(filename)), lineno_(lineno), colno_(colno) {}

  // e.g. "foo.py:3:1".
  std::string ToString() const {
    return absl::StrFormat("%s:%s", filename_, ToStringNoFile());
  }
  // e.g. "3:1".
  std::string ToStringNoFile() const {
    return absl::StrFormat("%d:%d", lineno_ + 1, colno_ + 1);
  }

  bool operator<(const Pos& other) const {
    CORAL_CHECK_EQ(filename_, other.filename_);
    return std::tie(lineno_, colno_) < std::tie(other.lineno_, other.colno_);
  }
  bool operator==(const Pos& other) const {
    CORAL_CHECK_EQ(filename_, other.filename_);
    return lineno_ == other.lineno_ && colno_ == other.colno_;
  }
  bool operator!=(const Pos& other) const { return !(*this == other); }
  bool operator<=(const Pos& other) const { return !(other < *this); }

  const std::string& filename() const { return filename_; }
  int64_t lineno() const { return lineno_; }
  int64_t colno() const { return colno_; }

 private:
  std::string filename_;
  int64_t lineno_;
  int64_t colno_;
};

inline std::ostream& operator<<(std::ostream& os, const Pos& pos) {
  return os << pos.ToString();
}

// The half-open source range [start, limit) within one file.
class Span {
 public:
  // Parses the form produced by ToString(), e.g. "foo.py:1:5-1:9". Used to
  // recover the location of an error from its status message.
  static absl::StatusOr<Span> FromString(absl::string_view s);

  Span() = default;
  Span(Pos start, Pos limit)
      : start_(std::move(start)), limit_(std::move(limit)) {
    CORAL_CHECK(start_ <= limit_) << start_ << " vs " << limit_;
  }

  const std::string& filename() const { return start_.filename(); }
  const Pos& start() const { return start_; }
  const Pos& limit() const { return limit_; }

  bool operator==(const Span& other) const {
    return start_ == other.start_ && limit_ == other.limit_;
  }
  bool operator!=(const Span& other) const { return !(*this == other); }

  std::string ToString() const {
    return absl::StrFormat("%s-%s", start_.ToString(),
                           limit_.ToStringNoFile());
  }

 private:
  Pos start_;
  Pos limit_;
};

inline std::ostream& operator<<(std::ostream& os, const Span& span) {
  return os << span.ToString();
}

}  // namespace coral

#endif  // CORAL_FRONTEND_POS_H_
