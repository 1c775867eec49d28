#include "core/TagResolver.hpp"

#include <algorithm>
#include <utility>

#include "core/Constants.hpp"
#include "core/ObjectReader.hpp"
#include "util/FileSystem.hpp"
#include "util/Logger.hpp"
#include "util/ObjectId.hpp"
#include "util/StringUtils.hpp"

namespace fs = std::filesystem;

namespace gitcontext {

TagResolver::TagResolver(const IFileSystem& fileSystem, fs::path gitDir)
    : fileSystem(fileSystem), gitDir(std::move(gitDir)) {}

fs::path TagResolver::tagsDir() const {
    return gitDir / Constants::TAGS_DIR;
}

Expected<std::optional<TagInfo>> TagResolver::resolve(
    const std::string& tagName,
    const std::optional<std::string>& commitMatch
) const {
    fs::path tagPath = tagsDir() / tagName;
    bool plainName = !tagName.empty() && tagName != "." && tagName != ".."
        && tagName.find('/') == std::string::npos;
    if (!plainName || !fileSystem.isRegularFile(tagPath)) {
        return Error{ErrorCode::NotFound, "Tag file not found: " + tagName};
    }

    auto contentRes = fileSystem.readText(tagPath);
    if (!contentRes) return contentRes.error();
    std::string target = StringUtils::trim(contentRes.value());

    if (commitMatch && target == *commitMatch) {
        return std::optional<TagInfo>(TagInfo{target, tagName, std::nullopt});
    }

    if (!isValidHash(target)) {
        return Error{ErrorCode::MalformedObject, "Invalid tag hash in " + tagName};
    }

    auto readerRes = ObjectReader::open(fileSystem, gitDir / Constants::OBJECTS_DIR, target);
    if (!readerRes) return readerRes.error();
    ObjectReader& reader = *readerRes.value();

    auto type = reader.readHeader();
    if (!type) return type.error();

    if (type.value() == Constants::TYPE_COMMIT && !commitMatch) {
        return std::optional<TagInfo>(TagInfo{target, tagName, std::nullopt});
    }
    if (type.value() != Constants::TYPE_TAG) {
        return std::optional<TagInfo>();
    }

    std::optional<std::string> commit;
    while (true) {
        auto field = reader.readField();
        if (!field) return field.error();
        if (!field.value()) break;

        const ObjectField& entry = *field.value();
        if (entry.key == Constants::KEY_OBJECT) {
            if (!isValidHash(entry.value)) {
                return Error{ErrorCode::MalformedObject, "Invalid object hash in tag " + tagName};
            }
            if (commitMatch && entry.value != *commitMatch) {
                return std::optional<TagInfo>();
            }
            commit = entry.value;
        } else if (entry.key == Constants::KEY_TYPE) {
            if (entry.value != Constants::TYPE_COMMIT) {
                return std::optional<TagInfo>();
            }
        }
    }

    auto message = reader.readBody();
    if (!message) return message.error();

    if (!commit) {
        return Error{ErrorCode::MalformedObject, "Invalid tag format: missing object in " + tagName};
    }

    return std::optional<TagInfo>(TagInfo{*commit, tagName, std::move(message.value())});
}

Expected<std::vector<TagInfo>> TagResolver::listForCommit(const std::string& commitHash) const {
    std::vector<TagInfo> tags;
    fs::path dir = tagsDir();
    if (!fileSystem.isDirectory(dir)) {
        return tags;
    }

    auto namesRes = fileSystem.listFiles(dir);
    if (!namesRes) return namesRes.error();
    std::vector<std::string> names = namesRes.value();
    std::sort(names.begin(), names.end());

    for (const auto& name : names) {
        auto res = resolve(name, commitHash);
        if (!res) {
            Logger::instance().warn("Skipping tag " + name + ": " + res.error().message);
            continue;
        }
        if (res.value()) {
            tags.push_back(*res.value());
        }
    }

    Logger::instance().debug(std::to_string(tags.size()) + " tag(s) point at " + shortHash(commitHash));
    return tags;
}

}
