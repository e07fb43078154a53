#include "Resilience.h"

#include <fstream>
#include <iterator>

namespace Domain::Resilience
{

std::string readFileWithFallback(const std::filesystem::path& path, std::string_view fallback)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        return std::string(fallback);
    }

    std::string contents{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad())
    {
        return std::string(fallback);
    }
    return contents;
}

} // namespace Domain::Resilience
