#include "guidiar/annotation.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace guidiar {

AnnotationIndex::AnnotationIndex(std::vector<FileMetadata> files,
                                 const std::vector<Annotation> &annotations)
    : files_(std::move(files)), by_file_(files_.size()) {
    for (const auto &a : annotations) {
        if (a.file_id < 0 || a.file_id >= num_files()) {
            throw std::invalid_argument(
                "AnnotationIndex: annotation refers to unknown file " +
                std::to_string(a.file_id));
        }
        if (a.end < a.start) {
            throw std::invalid_argument(
                "AnnotationIndex: annotation ends before it starts in file " +
                std::to_string(a.file_id));
        }
        by_file_[a.file_id].push_back(a);
    }
}

void AnnotationIndex::check_file_id_(int file_id) const {
    if (file_id < 0 || file_id >= num_files()) {
        throw std::out_of_range("AnnotationIndex: unknown file " +
                                std::to_string(file_id));
    }
}

const FileMetadata &AnnotationIndex::metadata(int file_id) const {
    check_file_id_(file_id);
    return files_[file_id];
}

const std::vector<Annotation> &
AnnotationIndex::annotations(int file_id) const {
    check_file_id_(file_id);
    return by_file_[file_id];
}

std::vector<Annotation> AnnotationIndex::overlapping(int file_id,
                                                     const Chunk &chunk) const {
    std::vector<Annotation> result;
    for (const auto &a : annotations(file_id)) {
        if (intersects(a, chunk)) {
            result.push_back(a);
        }
    }
    return result;
}

} // namespace guidiar
