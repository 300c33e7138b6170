#pragma once

#include <array>
#include <vector>

namespace guidiar {

// ─── Annotation Types ───────────────────────────────────────────────────────

// Label identity space of a file. Labels from two files only refer to the
// same speaker when compared in a shared scope.
enum class Scope {
    File = 0,
    Database = 1,
    Global = 2,
};

struct Annotation {
    int file_id = 0;
    double start = 0.0; // seconds
    double end = 0.0;   // seconds
    std::array<int, 3> labels = {0, 0, 0}; // label index per Scope

    int label(Scope scope) const { return labels[static_cast<int>(scope)]; }
};

struct FileMetadata {
    Scope scope = Scope::File; // scope the file's labels are read in
    int database = 0;
};

struct Chunk {
    double start = 0.0;    // seconds
    double duration = 0.0; // seconds

    double end() const { return start + duration; }
};

// Strict overlap: a turn that only touches the chunk boundary is excluded.
inline bool intersects(const Annotation &a, const Chunk &chunk) {
    return a.start < chunk.end() && a.end > chunk.start;
}

// ─── Annotation Index ───────────────────────────────────────────────────────

// Read-only view of a corpus: per-file metadata plus speaker turns grouped by
// file. File ids are positions in the metadata list.
class AnnotationIndex {
  public:
    AnnotationIndex() = default;

    // Throws std::invalid_argument on a turn with an unknown file id or with
    // end < start.
    AnnotationIndex(std::vector<FileMetadata> files,
                    const std::vector<Annotation> &annotations);

    int num_files() const { return static_cast<int>(files_.size()); }

    // Both throw std::out_of_range on an unknown file id.
    const FileMetadata &metadata(int file_id) const;
    const std::vector<Annotation> &annotations(int file_id) const;

    // Turns of `file_id` with non-empty intersection with `chunk`.
    std::vector<Annotation> overlapping(int file_id, const Chunk &chunk) const;

  private:
    std::vector<FileMetadata> files_;
    std::vector<std::vector<Annotation>> by_file_;

    void check_file_id_(int file_id) const;
};

} // namespace guidiar
