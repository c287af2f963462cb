#include "PageSelection.hpp"

#include <cctype>

namespace job
{

namespace
{

std::string strip(const std::string& s)
{
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return s.substr(begin, end - begin);
}

bool parsePage(const std::string& token, int& out)
{
    if (token.empty() || token.size() > 9)
        return false;
    for (char c : token)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    }
    out = std::stoi(token);
    return out > 0;
}

bool parseItem(const std::string& item, PageRange& range, std::string& error)
{
    const auto dash = item.find('-');
    if (dash == std::string::npos)
    {
        if (!parsePage(item, range.first))
        {
            error = "Invalid page number '" + item + "'";
            return false;
        }
        range.last = range.first;
        return true;
    }

    const std::string lo = strip(item.substr(0, dash));
    const std::string hi = strip(item.substr(dash + 1));
    if (lo.empty() && hi.empty())
    {
        error = "Invalid page range '" + item + "'";
        return false;
    }
    if (!lo.empty() && !parsePage(lo, range.first))
    {
        error = "Invalid page range start in '" + item + "'";
        return false;
    }
    if (!hi.empty() && !parsePage(hi, range.last))
    {
        error = "Invalid page range end in '" + item + "'";
        return false;
    }
    if (range.last != 0 && range.last < range.first)
    {
        error = "Page range '" + item + "' ends before it starts";
        return false;
    }
    return true;
}

} // namespace

bool PageSelection::parse(const std::string& text, PageSelection& out, std::string& error)
{
    out.ranges_.clear();
    const std::string trimmed = strip(text);
    if (trimmed.empty())
        return true;

    // Every comma separates two items, so "1,2," and "1,,2" both hold an empty one.
    std::size_t begin = 0;
    while (true)
    {
        const std::size_t comma = trimmed.find(',', begin);
        const std::string item =
            strip(trimmed.substr(begin, comma == std::string::npos ? std::string::npos : comma - begin));
        if (item.empty())
        {
            error = "Empty item in page selection: " + text;
            out.ranges_.clear();
            return false;
        }

        PageRange range;
        if (!parseItem(item, range, error))
        {
            out.ranges_.clear();
            return false;
        }
        out.ranges_.push_back(range);

        if (comma == std::string::npos)
            break;
        begin = comma + 1;
    }

    return true;
}

} // namespace job
