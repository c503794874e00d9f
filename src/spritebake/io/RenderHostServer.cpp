#include "spritebake/io/RenderHostServer.hpp"
#include "RenderHostCodec.hpp"
#include "spritebake.grpc.pb.h"

#include <grpcpp/grpcpp.h>

#include <exception>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

namespace spritebake {

//------------------------------------------------------------------------------
// gRPC render host
//  - one mutex around the scene: hosts are not reentrant
//  - scene exceptions become INTERNAL status, render failures travel in the reply
//------------------------------------------------------------------------------
class RenderHostServer::Impl : public RenderHost::Service {
public:
    Impl(IScene& scene, std::uint16_t port, Options opt)
        : scene_(scene), opt_(std::move(opt))
    {
        const std::string addr = opt_.bindHost + ":" + std::to_string(port);
        grpc::ServerBuilder b;
        b.AddListeningPort(addr, grpc::InsecureServerCredentials(), &port_);
        b.SetMaxSendMessageSize(-1);
        b.RegisterService(this);
        server_ = b.BuildAndStart();
        if (!server_ || port_ == 0) {
            throw std::runtime_error("RenderHostServer: cannot listen on " + addr);
        }
        std::cout << "[render-host] listening at " << opt_.bindHost << ":" << port_ << "\n";
    }

    ~Impl() override { stop(); }

    int port() const noexcept { return port_; }

    void wait() { if (server_) server_->Wait(); }

    void stop() {
        std::lock_guard<std::mutex> lk(stopM_);
        if (server_ && !stopped_) {
            server_->Shutdown();
            stopped_ = true;
            std::cout << "[render-host] stopped\n";
        }
    }

    ::grpc::Status GetTime(::grpc::ServerContext*, const Empty*, TimePB* reply) override {
        return guarded("GetTime", [&]{ reply->set_frame(scene_.currentTime()); });
    }

    ::grpc::Status SetTime(::grpc::ServerContext*, const TimePB* req, Empty*) override {
        return guarded("SetTime", [&]{ scene_.setTime(req->frame()); });
    }

    ::grpc::Status GetWorldBounds(::grpc::ServerContext*, const TimePB* req, BoundsReply* reply) override {
        return guarded("GetWorldBounds", [&]{
            const auto b = scene_.getWorldBounds(req->frame());
            reply->set_present(b.has_value());
            if (b) wire::toPb(*b, reply->mutable_bounds());
        });
    }

    ::grpc::Status GetCamera(::grpc::ServerContext*, const Empty*, CameraPB* reply) override {
        return guarded("GetCamera", [&]{
            const CameraState s = scene_.camera();
            wire::toPb(s.pose, s.projection, reply);
        });
    }

    ::grpc::Status SetCamera(::grpc::ServerContext*, const CameraPB* req, Empty*) override {
        return guarded("SetCamera", [&]{
            const CameraState s = wire::fromPb(*req);
            scene_.setCamera(s.pose, s.projection);
        });
    }

    ::grpc::Status Render(::grpc::ServerContext*, const RenderRequest* req, RenderReply* reply) override {
        return guarded("Render", [&]{
            FrameBuffer fb;
            const RenderStatus st = scene_.render(req->width(), req->height(), fb);
            reply->set_ok(st.ok);
            if (!st.ok) {
                reply->set_message(st.message);
                return;
            }
            reply->set_width(fb.width);
            reply->set_height(fb.height);
            reply->set_rgba(reinterpret_cast<const char*>(fb.rgba.data()), fb.rgba.size());
            reply->set_crc32(wire::crc32Bytes(fb.rgba.data(), fb.rgba.size()));
        });
    }

private:
    template <class Fn>
    ::grpc::Status guarded(const char* call, Fn&& fn) {
        std::lock_guard<std::mutex> lk(sceneM_);
        if (opt_.logCalls) std::cout << "[render-host] " << call << "\n";
        try {
            fn();
            return ::grpc::Status::OK;
        } catch (const std::exception& e) {
            std::cerr << "[render-host] " << call << " failed: " << e.what() << "\n";
            return ::grpc::Status(::grpc::StatusCode::INTERNAL, e.what());
        }
    }

    IScene& scene_;
    Options opt_;
    int port_{0};

    std::mutex sceneM_;
    std::mutex stopM_;
    bool stopped_{false};
    std::unique_ptr<grpc::Server> server_;
};

RenderHostServer::RenderHostServer(IScene& scene, std::uint16_t port)
    : p_(std::make_unique<Impl>(scene, port, Options{})) {}

RenderHostServer::RenderHostServer(IScene& scene, std::uint16_t port, Options opt)
    : p_(std::make_unique<Impl>(scene, port, std::move(opt))) {}

RenderHostServer::~RenderHostServer() = default;

int RenderHostServer::port() const noexcept { return p_->port(); }
void RenderHostServer::wait() { p_->wait(); }
void RenderHostServer::shutdown() { p_->stop(); }

} // namespace spritebake
