#include "core/GitSnapshot.hpp"

#include "core/RepositoryReader.hpp"

namespace gitcontext {

GitSnapshot GitSnapshot::collect(RepositoryReader& reader) {
    // Request everything first; each backing value is still read only once
    auto hash = reader.commitHash();
    auto branch = reader.branch();
    auto isDetached = reader.isDetached();
    auto author = reader.author();
    auto date = reader.date();
    auto message = reader.message();
    auto parents = reader.parents();
    auto tags = reader.tags();

    GitSnapshot snapshot;
    snapshot.hash = hash.get();
    snapshot.branch = branch.get();
    snapshot.isDetached = isDetached.get();
    snapshot.author = author.get();
    snapshot.date = date.get();
    snapshot.message = message.get();
    snapshot.parents = parents.get();
    snapshot.tags = tags.get();
    return snapshot;
}

}
