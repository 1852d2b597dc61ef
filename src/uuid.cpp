#include "engram/uuid.hpp"
#include "engram/error.hpp"
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <mutex>
#include <stdexcept>

namespace engram {

Uuid generate_uuid() {
    // random_generator is not thread-safe
    static boost::uuids::random_generator generator;
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    return generator();
}

std::optional<Uuid> try_parse_uuid(const std::string& text) {
    // string_generator also accepts braced and unhyphenated forms; point ids
    // must be canonical so the backend sees a single spelling per id.
    if (text.size() != 36 || text[8] != '-' || text[13] != '-' ||
        text[18] != '-' || text[23] != '-') {
        return std::nullopt;
    }

    try {
        boost::uuids::string_generator gen;
        return gen(text);
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

Uuid parse_uuid(const std::string& text) {
    auto id = try_parse_uuid(text);
    if (!id) {
        throw InvalidArgumentError("Malformed UUID: '" + text + "'", __func__,
                                   "Use the canonical 8-4-4-4-12 hexadecimal form");
    }
    return *id;
}

std::string to_string(const Uuid& id) {
    return boost::uuids::to_string(id);
}

} // namespace engram
