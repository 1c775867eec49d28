#include "core/ObjectReader.hpp"

#include "core/Constants.hpp"
#include "util/FileSystem.hpp"
#include "util/Logger.hpp"
#include "util/ObjectId.hpp"

namespace fs = std::filesystem;

namespace gitcontext {

fs::path ObjectReader::objectPath(const fs::path& objectsDir, const std::string& hash) {
    // Git stores objects as: .git/objects/<first-2-chars>/<remaining-chars>
    std::string dir = hash.substr(0, Constants::OBJECT_DIR_LENGTH);
    std::string file = hash.substr(Constants::OBJECT_DIR_LENGTH);
    return objectsDir / dir / file;
}

Expected<std::unique_ptr<ObjectReader>> ObjectReader::open(
    const IFileSystem& fileSystem,
    const fs::path& objectsDir,
    const std::string& hash
) {
    if (!isValidHash(hash)) {
        return Error{ErrorCode::MalformedObject, "Invalid object hash: " + hash};
    }

    fs::path path = objectPath(objectsDir, hash);
    if (!fileSystem.isRegularFile(path)) {
        return Error{ErrorCode::NotFound, "Object not found: " + hash};
    }

    auto in = fileSystem.openBinary(path);
    if (!in) return in.error();

    std::unique_ptr<ObjectReader> reader(new ObjectReader(std::move(in.value()), hash));
    auto initRes = reader->init();
    if (!initRes) return initRes.error();

    Logger::instance().debug("Opened object " + shortHash(hash));
    return Expected<std::unique_ptr<ObjectReader>>(std::move(reader));
}

ObjectReader::ObjectReader(std::unique_ptr<std::istream> input, std::string hash)
    : input(std::move(input)),
      objectHash(std::move(hash)),
      inBuffer(Constants::INFLATE_CHUNK),
      outBuffer(Constants::INFLATE_CHUNK) {}

ObjectReader::~ObjectReader() {
    if (streamInitialized) {
        inflateEnd(&stream);
    }
}

Expected<void> ObjectReader::init() {
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;
    stream.avail_in = 0;
    stream.next_in = Z_NULL;

    if (inflateInit(&stream) != Z_OK) {
        return Error{ErrorCode::InternalError, "zlib inflateInit failed"};
    }
    streamInitialized = true;
    return {};
}

Expected<bool> ObjectReader::fill() {
    while (!streamEnded) {
        if (stream.avail_in == 0) {
            input->read(inBuffer.data(), static_cast<std::streamsize>(inBuffer.size()));
            std::streamsize got = input->gcount();
            if (got <= 0) {
                if (input->bad()) {
                    return Error{ErrorCode::IoError, "Error reading object file: " + objectHash};
                }
                return Error{ErrorCode::MalformedObject, "Truncated object: " + objectHash};
            }
            stream.next_in = reinterpret_cast<Bytef*>(inBuffer.data());
            stream.avail_in = static_cast<uInt>(got);
        }

        stream.next_out = outBuffer.data();
        stream.avail_out = static_cast<uInt>(outBuffer.size());

        int ret = inflate(&stream, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            streamEnded = true;
        } else if (ret != Z_OK) {
            return Error{ErrorCode::MalformedObject, "zlib inflate failed for object: " + objectHash};
        }

        size_t have = outBuffer.size() - stream.avail_out;
        if (have > 0) {
            pending.append(reinterpret_cast<const char*>(outBuffer.data()), have);
            return true;
        }
    }
    return false;
}

Expected<bool> ObjectReader::ensureAvailable() {
    while (cursor >= pending.size()) {
        auto more = fill();
        if (!more) return more.error();
        if (!more.value()) return false;
    }
    return true;
}

Expected<bool> ObjectReader::readUntil(char delim, std::string& out) {
    out.clear();
    size_t searchFrom = cursor;
    while (true) {
        size_t pos = pending.find(delim, searchFrom);
        if (pos != std::string::npos) {
            out = pending.substr(cursor, pos - cursor);
            cursor = pos + 1;
            break;
        }
        searchFrom = pending.size();
        auto more = fill();
        if (!more) return more.error();
        if (!more.value()) {
            out = pending.substr(cursor);
            cursor = pending.size();
            return false;
        }
    }

    // Drop consumed bytes once they dominate the buffer
    if (cursor > Constants::INFLATE_CHUNK && cursor * 2 > pending.size()) {
        pending.erase(0, cursor);
        cursor = 0;
    }
    return true;
}

Expected<std::string> ObjectReader::readHeader() {
    if (phase != Phase::Header) {
        return Error{ErrorCode::InternalError, "Object header already read: " + objectHash};
    }

    std::string header;
    auto found = readUntil('\0', header);
    if (!found) return found.error();
    if (!found.value()) {
        return Error{ErrorCode::MalformedObject, "Invalid object format (no header terminator): " + objectHash};
    }

    // "<type> <size>"; the size is informational here
    size_t space = header.find(' ');
    if (space == std::string::npos || space == 0) {
        return Error{ErrorCode::MalformedObject, "Invalid object format: " + objectHash};
    }

    phase = Phase::Fields;
    return header.substr(0, space);
}

Expected<std::optional<ObjectField>> ObjectReader::readField() {
    if (phase != Phase::Fields) {
        return Error{ErrorCode::InternalError,
                     phase == Phase::Header ? "readHeader must be called first" : "Object fields already consumed"};
    }

    std::string line;
    auto found = readUntil('\n', line);
    if (!found) return found.error();
    if (!found.value() && line.empty()) {
        return Error{ErrorCode::MalformedObject, "Unexpected end of object: " + objectHash};
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    if (line.empty()) {
        // Blank line: body follows
        phase = Phase::Body;
        return std::optional<ObjectField>();
    }

    size_t space = line.find(' ');
    if (space == std::string::npos || space == 0) {
        return Error{ErrorCode::MalformedObject, "Invalid object format: " + objectHash};
    }

    ObjectField field{line.substr(0, space), line.substr(space + 1)};

    // Fold continuation lines (" <text>") into this field
    while (true) {
        auto available = ensureAvailable();
        if (!available) return available.error();
        if (!available.value() || pending[cursor] != ' ') {
            break;
        }
        std::string continuation;
        auto more = readUntil('\n', continuation);
        if (!more) return more.error();
        if (!continuation.empty() && continuation.back() == '\r') {
            continuation.pop_back();
        }
        field.value += '\n';
        field.value += continuation.substr(1);
    }

    return std::optional<ObjectField>(std::move(field));
}

Expected<std::string> ObjectReader::readBody() {
    if (phase != Phase::Body) {
        return Error{ErrorCode::InternalError,
                     phase == Phase::Done ? "Object body already read" : "Object fields not fully read"};
    }

    while (true) {
        auto more = fill();
        if (!more) return more.error();
        if (!more.value()) break;
    }

    std::string body = pending.substr(cursor);
    pending.clear();
    cursor = 0;
    phase = Phase::Done;
    return body;
}

}
