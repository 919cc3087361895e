#include "terrain/Chunk.hpp"

#include <algorithm>

namespace Lattice {

bool IsValidTransition(ChunkLoadState from, ChunkLoadState to) {
    switch (to) {
        case ChunkLoadState::Generate: return from == ChunkLoadState::Load;
        case ChunkLoadState::Done:     return from == ChunkLoadState::Generate;
        case ChunkLoadState::Unload:   return from != ChunkLoadState::Unload;
        case ChunkLoadState::Load:     return false;
    }
    return false;
}

const char* ChunkLoadStateToString(ChunkLoadState state) {
    switch (state) {
        case ChunkLoadState::Load:     return "Load";
        case ChunkLoadState::Generate: return "Generate";
        case ChunkLoadState::Done:     return "Done";
        case ChunkLoadState::Unload:   return "Unload";
        default:                       return "Unknown";
    }
}

// ============================================================================
// VoxelBuffer
// ============================================================================

VoxelBuffer::VoxelBuffer()
    : m_voxels(VOXEL_COUNT) {
}

size_t VoxelBuffer::CountMaterial(VoxelMaterial material) const {
    return static_cast<size_t>(std::count_if(m_voxels.begin(), m_voxels.end(),
        [material](const Voxel& v) { return v.GetMaterial() == material; }));
}

bool VoxelBuffer::IsEmpty() const {
    return std::all_of(m_voxels.begin(), m_voxels.end(),
        [](const Voxel& v) { return v == Voxel{}; });
}

void VoxelBuffer::Clear() {
    std::fill(m_voxels.begin(), m_voxels.end(), Voxel{});
}

// ============================================================================
// Chunk
// ============================================================================

Chunk::Chunk(ChunkCoord coord, ChunkHandle handle)
    : m_coord(coord)
    , m_handle(handle) {
}

bool Chunk::TransitionTo(ChunkLoadState next) {
    if (!IsValidTransition(m_state, next)) {
        return false;
    }
    m_state = next;
    return true;
}

} // namespace Lattice
