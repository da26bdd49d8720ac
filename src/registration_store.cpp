#include "registration_store.hpp"
#include <filesystem>
#include <fstream>

namespace pathtrie {

std::vector<std::uint8_t> read_file_bytes(const std::string& file) {
    // A directory opens fine on some platforms and reports a bogus size
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        throw serialization_error("not a regular file: " + file);
    }

    std::ifstream in(file, std::ios::binary | std::ios::ate);
    if (!in) throw serialization_error("cannot open file: " + file);

    auto size = in.tellg();
    if (size < 0) throw serialization_error("cannot determine size of file: " + file);
    in.seekg(0);
    std::vector<std::uint8_t> buf(static_cast<size_t>(size));
    in.read(reinterpret_cast<char*>(buf.data()), size);
    if (!in) throw serialization_error("failed to read file: " + file);
    return buf;
}

void write_file_bytes(const std::string& file, std::span<const std::uint8_t> bytes) {
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out) throw serialization_error("cannot open file for writing: " + file);
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    if (!out) throw serialization_error("failed to write file: " + file);
}

nlohmann::json decode_document(std::span<const std::uint8_t> bytes) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::from_msgpack(bytes.begin(), bytes.end());
    } catch (const nlohmann::json::exception& e) {
        throw serialization_error(std::string("malformed document: ") + e.what());
    }
    if (!doc.is_object()) throw serialization_error("document root is not a map");

    auto version = doc.find("version");
    if (version == doc.end() || !version->is_number_integer() ||
        version->get<int>() != registrations_version) {
        throw serialization_error("unsupported document version");
    }
    return doc;
}

} // namespace pathtrie
