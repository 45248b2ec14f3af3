#pragma once

/*
    Full file contents for both sides of a diff.

    Paths are the ones named by the diff. The null path always resolves to
    an empty file. Providers are read from several threads at once and must
    not mutate shared state while answering.
*/

#include "util/readlines.hpp"

#include <filesystem>
#include <string>
#include <unordered_map>

namespace effdiff {

enum class Revision {
    Old,
    New,
};

std::string
repr(Revision revision);

class FileContentProvider {
   public:
    virtual ~FileContentProvider() = default;

    ReadStatus
    content(const std::string& path, Revision revision, std::string& contents) const;

   protected:
    virtual ReadStatus
    load(const std::string& path, Revision revision, std::string& contents) const = 0;
};

using FileContentMap = std::unordered_map<std::string, std::string>;

class InMemoryFileContents : public FileContentProvider {
   public:
    InMemoryFileContents(FileContentMap old_files, FileContentMap new_files);

   protected:
    ReadStatus
    load(const std::string& path, Revision revision, std::string& contents) const override;

   private:
    FileContentMap old_files_;
    FileContentMap new_files_;
};

// Reads files from two checkouts of the repository.
class WorktreeFileContents : public FileContentProvider {
   public:
    WorktreeFileContents(std::filesystem::path old_root, std::filesystem::path new_root);

   protected:
    ReadStatus
    load(const std::string& path, Revision revision, std::string& contents) const override;

   private:
    std::filesystem::path old_root_;
    std::filesystem::path new_root_;
};

}  // namespace effdiff
