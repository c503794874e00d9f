#pragma once
// Conversions between core types and RenderHost messages (client + server).

#include "spritebake/core/Geometry.hpp"
#include "spritebake.pb.h"

#include <zlib.h>

#include <cstddef>
#include <cstdint>

namespace spritebake::wire {

inline std::uint32_t crc32Bytes(const void* data, std::size_t size) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(size));
    return static_cast<std::uint32_t>(crc);
}

inline void toPb(const Vec3& v, Vec3PB* out) {
    out->set_x(v.x);
    out->set_y(v.y);
    out->set_z(v.z);
}

inline Vec3 fromPb(const Vec3PB& v) { return Vec3{v.x(), v.y(), v.z()}; }

inline void toPb(const Aabb& b, AabbPB* out) {
    toPb(b.min, out->mutable_min());
    toPb(b.max, out->mutable_max());
}

inline Aabb fromPb(const AabbPB& b) { return Aabb{fromPb(b.min()), fromPb(b.max())}; }

inline void toPb(const CameraPose& pose, const Projection& proj, CameraPB* out) {
    toPb(pose.position, out->mutable_position());
    toPb(pose.right,    out->mutable_right());
    toPb(pose.up,       out->mutable_up());
    toPb(pose.forward,  out->mutable_forward());
    out->set_projection(proj.type == ProjectionType::Perspective ? ProjectionPB::PERSPECTIVE
                                                                 : ProjectionPB::ORTHOGRAPHIC);
    out->set_scale(proj.scale);
    out->set_fov_y_deg(proj.fovYDeg);
    out->set_clip_start(proj.clipStart);
    out->set_clip_end(proj.clipEnd);
}

inline CameraState fromPb(const CameraPB& c) {
    CameraState s;
    s.pose.position = fromPb(c.position());
    s.pose.right    = fromPb(c.right());
    s.pose.up       = fromPb(c.up());
    s.pose.forward  = fromPb(c.forward());
    s.projection.type = c.projection() == ProjectionPB::PERSPECTIVE ? ProjectionType::Perspective
                                                                    : ProjectionType::Orthographic;
    s.projection.scale     = c.scale();
    s.projection.fovYDeg   = c.fov_y_deg();
    s.projection.clipStart = c.clip_start();
    s.projection.clipEnd   = c.clip_end();
    return s;
}

} // namespace spritebake::wire
