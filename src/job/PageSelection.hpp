#pragma once

#include <string>
#include <vector>

namespace job
{

struct PageRange
{
    int first = 1;
    int last = 0; // 0 = through the last page
};

/// Page subset written as "1,2,1-,-3,3-5". Pages are 1-based.
/// An empty selection means the whole document.
class PageSelection
{
public:
    static bool parse(const std::string& text, PageSelection& out, std::string& error);

    bool all() const { return ranges_.empty(); }
    const std::vector<PageRange>& ranges() const { return ranges_; }

private:
    std::vector<PageRange> ranges_;
};

} // namespace job
