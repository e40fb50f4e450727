#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace TransferHub
{

/**
 * Identifier and path helpers shared by the facade, the engine and the CLI
 */
class StringUtils
{
    public:
    /**
     * Stable 64-bit FNV-1a hash of a string
     */
    static uint64_t fnv1a64(std::string_view text);

    /**
     * Local file name derived from a resource identifier
     * @param resource_id URL or other identifier
     * @return 16 hex digits of the identifier hash followed by its extension
     */
    static std::string hashName(std::string_view resource_id);

    /**
     * Extension of the last path segment, including the dot, query stripped
     * @return ".zip" for "https://host/a.zip?x=1", empty when there is none
     */
    static std::string fileExtension(std::string_view resource_id);

    /**
     * Last path segment with any query or fragment removed
     */
    static std::string baseName(std::string_view resource_id);

    /**
     * Filesystem path named by a plain path or a file:// URL
     * @return empty string when the identifier uses another scheme
     */
    static std::string localPathFromUrl(std::string_view resource_id);

    static std::string toLower(std::string_view text);
    static std::string trim(std::string_view text);
};

} // namespace TransferHub
