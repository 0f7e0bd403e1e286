#include "idscrub/idscrub.hpp"
#include "idscrub/fileio.hpp"
#include "idscrub/json.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace idscrub {

Result<Config> load_config(const std::filesystem::path& path, Config base) {
    auto content = fileio::read_file(path);
    if (content.is_error()) {
        return Result<Config>::error(content.error_code(), content.error_message());
    }

    try {
        auto j = nlohmann::json::parse(content.value());
        json::apply_config(j, base);
    } catch (const nlohmann::json::exception& e) {
        return Result<Config>::error(ErrorCode::ParseError,
                                     path.string() + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        return Result<Config>::error(ErrorCode::ParseError,
                                     path.string() + ": " + e.what());
    }

    return Result<Config>::ok(std::move(base));
}

}  // namespace idscrub
