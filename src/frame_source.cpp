#include "frame_source.hpp"

const char* to_string(SourceKind kind) {
    switch (kind) {
        case SourceKind::LoopbackDevice: return "loopback device";
        case SourceKind::LocalFile: return "local file";
        case SourceKind::RemoteURLStream: return "remote stream";
    }
    return "unknown";
}
