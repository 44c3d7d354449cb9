#include "remote/dest_path.hpp"
#include "util/log.hpp"

namespace remote
{
namespace fs = std::filesystem;

std::string resolve_dest_path(const fs::path &item_parent_dir, const fs::path &tree_root)
{
    const fs::path dir  = item_parent_dir.lexically_normal();
    const fs::path root = tree_root.lexically_normal();

    // compare component by component; empty trailing components come from a final '/'
    auto d = dir.begin();
    for (auto r = root.begin(); r != root.end(); ++r)
    {
        if (r->empty())
            continue;
        if (d == dir.end() || *d != *r)
        {
            LOG_WARN("%s is not below %s", dir.c_str(), root.c_str());
            return {};
        }
        ++d;
    }

    std::string out;
    for (; d != dir.end(); ++d)
    {
        if (d->empty() || *d == ".")
            continue;
        out = join_remote(out, d->string());
    }
    return out;
}

std::string join_remote(const std::string &a, const std::string &b)
{
    auto trim = [](const std::string &s) {
        const auto l = s.find_first_not_of('/');
        if (l == std::string::npos)
            return std::string{};
        const auto r = s.find_last_not_of('/');
        return s.substr(l, r - l + 1);
    };
    const std::string ta = trim(a);
    const std::string tb = trim(b);
    if (ta.empty())
        return tb;
    if (tb.empty())
        return ta;
    return ta + "/" + tb;
}

}  // namespace remote
