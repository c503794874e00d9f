#include "spritebake/io/RenderHostClient.hpp"
#include "spritebake/core/Config.hpp"
#include "RenderHostCodec.hpp"
#include "spritebake.grpc.pb.h"

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace spritebake {

class RemoteScene::Impl {
public:
    Impl(const std::string& addr, Options opt)
        : serverAddr_{addr}, opt_{opt}
    {
        // 2048x2048 RGBA frames exceed the default 4 MiB receive limit
        grpc::ChannelArguments args;
        args.SetMaxReceiveMessageSize(-1);
        channel_ = grpc::CreateCustomChannel(serverAddr_, grpc::InsecureChannelCredentials(), args);
        stub_ = RenderHost::NewStub(channel_);
        std::cout << "[render-client] using host " << serverAddr_ << "\n";
    }

    int getTime() {
        grpc::ClientContext ctx; arm(ctx);
        TimePB reply;
        check(stub_->GetTime(&ctx, Empty{}, &reply), "GetTime");
        return reply.frame();
    }

    void setTime(int frame) {
        grpc::ClientContext ctx; arm(ctx);
        TimePB req; req.set_frame(frame);
        Empty reply;
        check(stub_->SetTime(&ctx, req, &reply), "SetTime");
    }

    std::optional<Aabb> bounds(int frame) {
        grpc::ClientContext ctx; arm(ctx);
        TimePB req; req.set_frame(frame);
        BoundsReply reply;
        check(stub_->GetWorldBounds(&ctx, req, &reply), "GetWorldBounds");
        if (!reply.present()) return std::nullopt;
        return wire::fromPb(reply.bounds());
    }

    CameraState camera() {
        grpc::ClientContext ctx; arm(ctx);
        CameraPB reply;
        check(stub_->GetCamera(&ctx, Empty{}, &reply), "GetCamera");
        return wire::fromPb(reply);
    }

    void setCamera(const CameraPose& pose, const Projection& proj) {
        grpc::ClientContext ctx; arm(ctx);
        CameraPB req;
        wire::toPb(pose, proj, &req);
        Empty reply;
        check(stub_->SetCamera(&ctx, req, &reply), "SetCamera");
    }

    RenderStatus render(std::uint32_t w, std::uint32_t h, FrameBuffer& out) {
        grpc::ClientContext ctx; arm(ctx);
        RenderRequest req;
        req.set_width(w);
        req.set_height(h);
        RenderReply reply;

        const auto st = stub_->Render(&ctx, req, &reply);
        if (!st.ok()) {
            return RenderStatus::failure("Render RPC failed: " + st.error_message());
        }
        if (!reply.ok()) {
            return RenderStatus::failure(reply.message().empty() ? "host render failed" : reply.message());
        }

        const std::string& data = reply.rgba();
        if (opt_.verifyCrc) {
            const auto calc = wire::crc32Bytes(data.data(), data.size());
            if (calc != reply.crc32()) {
                std::cerr << "[render-client] CRC mismatch: got=" << reply.crc32()
                          << " calc=" << calc << "\n";
                return RenderStatus::failure("render payload CRC mismatch");
            }
        }

        // check the reply header before sizing a buffer from it
        const std::uint32_t rw = reply.width(), rh = reply.height();
        if (rw < 1 || rh < 1 || rw > kMaxFrameSide || rh > kMaxFrameSide) {
            return RenderStatus::failure("render reply is " + std::to_string(rw) + "x" +
                                         std::to_string(rh) + ", sides must be 1.." +
                                         std::to_string(kMaxFrameSide));
        }
        const std::uint64_t expected = std::uint64_t{rw} * rh * kRgbaChannels;
        if (data.size() != expected) {
            return RenderStatus::failure("render payload has " + std::to_string(data.size()) +
                                         " bytes, expected " + std::to_string(expected));
        }

        FrameBuffer fb(out.index, rw, rh);
        if (!data.empty()) std::memcpy(fb.rgba.data(), data.data(), data.size());
        out = std::move(fb);
        return {};
    }

private:
    void arm(grpc::ClientContext& ctx) const {
        ctx.set_deadline(std::chrono::system_clock::now() +
                         std::chrono::milliseconds(opt_.deadlineMs));
    }

    void check(const grpc::Status& st, const char* call) const {
        if (!st.ok()) {
            throw std::runtime_error(std::string(call) + " to " + serverAddr_ + " failed: " +
                                     st.error_message());
        }
    }

    std::string serverAddr_;
    Options     opt_;

    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<RenderHost::Stub> stub_;
};

RemoteScene::RemoteScene(const std::string& serverAddr)
    : pimpl_{std::make_unique<Impl>(serverAddr, Options{})} {}

RemoteScene::RemoteScene(const std::string& serverAddr, Options opt)
    : pimpl_{std::make_unique<Impl>(serverAddr, opt)} {}

RemoteScene::~RemoteScene() = default;

int RemoteScene::currentTime() const { return pimpl_->getTime(); }
void RemoteScene::setTime(int frame) { pimpl_->setTime(frame); }
std::optional<Aabb> RemoteScene::getWorldBounds(int frame) { return pimpl_->bounds(frame); }

CameraState RemoteScene::camera() const { return pimpl_->camera(); }

void RemoteScene::setCamera(const CameraPose& pose, const Projection& projection) {
    pimpl_->setCamera(pose, projection);
}

RenderStatus RemoteScene::render(std::uint32_t width, std::uint32_t height, FrameBuffer& out) {
    return pimpl_->render(width, height, out);
}

} // namespace spritebake
