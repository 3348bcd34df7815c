#pragma once

#include <string>

namespace sn::plan::model {

enum class EntryKind {
    File,
    Directory,
    Symlink,
};

inline std::string to_string(const EntryKind kind) {
    switch (kind) {
    case EntryKind::File: return "file";
    case EntryKind::Directory: return "directory";
    case EntryKind::Symlink: return "symlink";
    }
    return "unknown";
}

}
