#include <transfer-hub/string_utils.hpp>
#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace TransferHub
{

namespace
{
std::string_view stripQuery(std::string_view text)
{
    size_t cut = text.find_first_of("?#");
    return cut == std::string_view::npos ? text : text.substr(0, cut);
}
} // namespace

uint64_t StringUtils::fnv1a64(std::string_view text)
{
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text)
    {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::string StringUtils::hashName(std::string_view resource_id)
{
    return fmt::format("{:016x}{}", fnv1a64(resource_id), fileExtension(resource_id));
}

std::string StringUtils::fileExtension(std::string_view resource_id)
{
    std::string name = baseName(resource_id);
    size_t dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == name.size())
    {
        return {};
    }
    return name.substr(dot);
}

std::string StringUtils::baseName(std::string_view resource_id)
{
    std::string_view path = stripQuery(resource_id);

    // Skip "scheme://authority" so a bare host is not taken for a file name
    size_t scheme = path.find("://");
    if (scheme != std::string_view::npos)
    {
        size_t path_start = path.find('/', scheme + 3);
        if (path_start == std::string_view::npos)
        {
            return {};
        }
        path = path.substr(path_start);
    }

    size_t slash = path.find_last_of("/\\");
    return std::string(slash == std::string_view::npos ? path : path.substr(slash + 1));
}

std::string StringUtils::localPathFromUrl(std::string_view resource_id)
{
    constexpr std::string_view file_scheme = "file://";

    if (resource_id.substr(0, file_scheme.size()) == file_scheme)
    {
        return std::string(stripQuery(resource_id.substr(file_scheme.size())));
    }

    if (resource_id.find("://") != std::string_view::npos)
    {
        return {};
    }

    return std::string(resource_id);
}

std::string StringUtils::toLower(std::string_view text)
{
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

std::string StringUtils::trim(std::string_view text)
{
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos)
    {
        return {};
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(start, end - start + 1));
}

} // namespace TransferHub
