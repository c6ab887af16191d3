#pragma once

// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace deepcheck
{
namespace notice
{

struct Row
{
    std::string name;
    std::string value;
};

// One mismatch: a header, the trail where it was found and named rows,
// typically "want" and "have" with annotations around them. Renders as:
//
//   expected values to be equal:
//     trail: Items[1].Name
//      want: "abc"
//      have: "xyz"
class Notice
{
    std::string mHeader;
    std::string mTrail;
    std::vector<Row> mRows;

    Notice& setRow(std::string name, std::string value);

  public:
    explicit Notice(std::string header);

    Notice& setHeader(std::string header);
    Notice& setTrail(std::string trail);

    // Set (or replace) the "want" and "have" rows.
    Notice& want(std::string value);
    Notice& have(std::string value);

    // Adds a row after the existing ones.
    template <typename... Args>
    Notice&
    append(std::string name, fmt::format_string<Args...> f, Args&&... args)
    {
        mRows.push_back(
            Row{std::move(name), fmt::format(f, std::forward<Args>(args)...)});
        return *this;
    }

    // Adds a row before the existing ones.
    template <typename... Args>
    Notice&
    prepend(std::string name, fmt::format_string<Args...> f, Args&&... args)
    {
        mRows.insert(mRows.begin(), Row{std::move(name),
                                        fmt::format(f, std::forward<Args>(
                                                           args)...)});
        return *this;
    }

    std::string const&
    header() const
    {
        return mHeader;
    }

    std::string const&
    trail() const
    {
        return mTrail;
    }

    std::vector<Row> const&
    rows() const
    {
        return mRows;
    }

    // Value of the first row called `name`.
    std::optional<std::string> row(std::string const& name) const;

    std::string toString() const;
};

// Aggregate of notices in the order they were found.
class Error
{
    std::vector<Notice> mNotices;

  public:
    Error(Notice notice);
    explicit Error(std::vector<Notice> notices);

    std::vector<Notice> const&
    notices() const
    {
        return mNotices;
    }

    // Rendered notices separated by new lines.
    std::string message() const;
};

// Returns nullopt for an empty list.
std::optional<Error> join(std::vector<Notice> notices);

// Notices carried by `err`, none for nullopt.
std::vector<Notice> unwrap(std::optional<Error> const& err);

std::ostream& operator<<(std::ostream& out, Notice const& notice);
std::ostream& operator<<(std::ostream& out, Error const& err);
}
}

template <>
struct fmt::formatter<deepcheck::notice::Notice> : fmt::ostream_formatter
{
};

template <>
struct fmt::formatter<deepcheck::notice::Error> : fmt::ostream_formatter
{
};
