#ifndef GASDYNLIBRARY_STRINGUTILITIES_HPP
#define GASDYNLIBRARY_STRINGUTILITIES_HPP
#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace gasdyn::utilities {
class StringUtilities {
   public:
    /**
     * Returns a lower case copy of the string
     * @param str
     */
    static inline std::string ToLowerCopy(const std::string_view& str) {
        std::string strcopy(str.size(), 0);
        std::transform(str.begin(), str.end(), strcopy.begin(), ::tolower);
        return strcopy;
    }

    /**
     * Returns a copy of the string without leading or trailing whitespace
     * @param str
     * @return
     */
    static inline std::string TrimCopy(const std::string_view& str) {
        auto first = std::find_if_not(str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });
        auto last = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) { return std::isspace(c); }).base();
        return first < last ? std::string(first, last) : std::string();
    }

    /**
     * Reduces a name to a comparison key: lower case with whitespace, underscores, and hyphens removed.  "Carbon_Dioxide" and "carbon dioxide" share the key "carbondioxide".
     * @param str
     * @return
     */
    static inline std::string ToKey(const std::string_view& str) {
        std::string key;
        key.reserve(str.size());
        for (unsigned char c : str) {
            if (std::isspace(c) || c == '_' || c == '-') {
                continue;
            }
            key.push_back(static_cast<char>(std::tolower(c)));
        }
        return key;
    }

   private:
    StringUtilities() = delete;
};

}  // namespace gasdyn::utilities

#endif  // GASDYNLIBRARY_STRINGUTILITIES_HPP
