#include "file_contents.hpp"

#include "model/git_diff.hpp"

using namespace effdiff;

std::string
effdiff::repr(Revision revision) {
    return revision == Revision::Old ? "old" : "new";
}

ReadStatus
FileContentProvider::content(const std::string& path, Revision revision, std::string& contents) const {
    contents.clear();
    if (path == kNullPath) {
        return ReadStatus::kOk;
    }
    return load(path, revision, contents);
}

InMemoryFileContents::InMemoryFileContents(FileContentMap old_files, FileContentMap new_files)
    : old_files_(std::move(old_files)), new_files_(std::move(new_files)) {
}

ReadStatus
InMemoryFileContents::load(const std::string& path, Revision revision, std::string& contents) const {
    const auto& files = revision == Revision::Old ? old_files_ : new_files_;
    auto it = files.find(path);
    if (it == files.end()) {
        return ReadStatus::kFileNotFound;
    }
    contents = it->second;
    return ReadStatus::kOk;
}

WorktreeFileContents::WorktreeFileContents(std::filesystem::path old_root, std::filesystem::path new_root)
    : old_root_(std::move(old_root)), new_root_(std::move(new_root)) {
}

ReadStatus
WorktreeFileContents::load(const std::string& path, Revision revision, std::string& contents) const {
    const auto& root = revision == Revision::Old ? old_root_ : new_root_;
    return readfile((root / path).string(), contents);
}
