// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "notice/Notice.h"
#include <algorithm>

namespace deepcheck
{
namespace notice
{

Notice::Notice(std::string header) : mHeader(std::move(header))
{
}

Notice&
Notice::setRow(std::string name, std::string value)
{
    auto it = std::find_if(mRows.begin(), mRows.end(),
                           [&](Row const& r) { return r.name == name; });
    if (it != mRows.end())
    {
        it->value = std::move(value);
    }
    else
    {
        mRows.push_back(Row{std::move(name), std::move(value)});
    }
    return *this;
}

Notice&
Notice::setHeader(std::string header)
{
    mHeader = std::move(header);
    return *this;
}

Notice&
Notice::setTrail(std::string trail)
{
    mTrail = std::move(trail);
    return *this;
}

Notice&
Notice::want(std::string value)
{
    return setRow("want", std::move(value));
}

Notice&
Notice::have(std::string value)
{
    return setRow("have", std::move(value));
}

std::optional<std::string>
Notice::row(std::string const& name) const
{
    for (auto const& r : mRows)
    {
        if (r.name == name)
        {
            return r.value;
        }
    }
    return std::nullopt;
}

std::string
Notice::toString() const
{
    std::vector<Row const*> rows;
    Row trailRow{"trail", mTrail};
    if (!mTrail.empty())
    {
        rows.push_back(&trailRow);
    }
    for (auto const& r : mRows)
    {
        rows.push_back(&r);
    }
    if (rows.empty())
    {
        return mHeader;
    }

    size_t width = 0;
    for (auto r : rows)
    {
        width = std::max(width, r->name.size());
    }

    // Continuation lines of multi-line values start under the first one.
    std::string continuation = "\n" + std::string(width + 4, ' ');
    std::string res = mHeader + ":";
    for (auto r : rows)
    {
        std::string value;
        value.reserve(r->value.size());
        for (char c : r->value)
        {
            if (c == '\n')
            {
                value += continuation;
            }
            else
            {
                value.push_back(c);
            }
        }
        res += fmt::format("\n  {:>{}}: {}", r->name, width, value);
    }
    return res;
}

Error::Error(Notice notice) : mNotices{std::move(notice)}
{
}

Error::Error(std::vector<Notice> notices) : mNotices(std::move(notices))
{
}

std::string
Error::message() const
{
    std::string res;
    for (auto const& n : mNotices)
    {
        if (!res.empty())
        {
            res += "\n";
        }
        res += n.toString();
    }
    return res;
}

std::optional<Error>
join(std::vector<Notice> notices)
{
    if (notices.empty())
    {
        return std::nullopt;
    }
    return Error(std::move(notices));
}

std::vector<Notice>
unwrap(std::optional<Error> const& err)
{
    if (!err)
    {
        return {};
    }
    return err->notices();
}

std::ostream&
operator<<(std::ostream& out, Notice const& notice)
{
    return out << notice.toString();
}

std::ostream&
operator<<(std::ostream& out, Error const& err)
{
    return out << err.message();
}
}
}
