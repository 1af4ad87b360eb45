#include <casting/sim/SimulatedCommissioner.hpp>

#include <casting/Clusters.hpp>

#include <castlink/core/Logger.hpp>

#include <format>
#include <utility>

namespace casting::sim
{

namespace cl = casting::clusters;
using castlink::protocol::InteractionStatus;
using castlink::protocol::MessageView;
using castlink::protocol::PacketReader;
using castlink::protocol::PacketWriter;

namespace
{
constexpr std::uint16_t kCommissionedPort = 5540;

const std::vector<cl::target_navigator::TargetInfo> &simTargets()
{
    static const std::vector<cl::target_navigator::TargetInfo> targets = {
        {0, "Home"}, {1, "Live TV"}, {2, "Apps"}, {3, "Settings"}};
    return targets;
}

/// descriptor 로 커맨드 payload 를 엄격하게 읽는다.
template <typename Cmd> bool parseCommand(const MessageView &payload, Cmd &out)
{
    PacketReader r(payload);
    return out.read(r) && r.expectEnd();
}

template <typename Resp> std::vector<std::uint8_t> invokeResponse(std::uint32_t id, const Resp &resp)
{
    PacketWriter body;
    if (!resp.write(body))
        body.clear();
    castlink::protocol::InvokeResponseFrame f;
    f.correlationId = id;
    f.payload = body.view();
    return castlink::protocol::encodeFrame(f);
}

template <typename Attr>
bool writeAttr(PacketWriter &w, const typename Attr::Value &v)
{
    return Attr::write(w, v);
}
} // namespace

SimulatedCommissioner::SimulatedCommissioner(castlink::core::SimulatorConfig cfg)
    : cfg_(std::move(cfg)), dq_(std::chrono::milliseconds(10), 256, "sim")
{
}

SimulatedCommissioner::~SimulatedCommissioner()
{
    stop();
}

void SimulatedCommissioner::start()
{
    if (started_.exchange(true))
        return;
    dq_.start();
    CASTLINK_LOG_INFO("Sim", "Started", "device='{}' peers={} commission_delay_ms={}",
                      cfg_.deviceName, cfg_.peerCount, cfg_.commissioningDelayMs);
}

void SimulatedCommissioner::stop()
{
    if (!started_.exchange(false))
        return;
    sessionUp_.store(false, std::memory_order_release);
    dq_.stop();
    CASTLINK_LOG_INFO("Sim", "Stopped", "udc_requests={} frames={}", udcRequests_.load(),
                      framesReceived_.load());
}

std::shared_ptr<castlink::transport::ISessionEventSink> SimulatedCommissioner::lockSink_() const
{
    std::lock_guard<std::mutex> lock(sinkMu_);
    return sessionSink_.lock();
}

// ===== discovery =====

bool SimulatedCommissioner::browse(std::weak_ptr<castlink::transport::IDiscoverySink> sink)
{
    if (!started_.load())
        return false;

    const std::uint64_t gen = browseGen_.fetch_add(1) + 1;
    {
        std::lock_guard<std::mutex> lock(sinkMu_);
        discoverySink_ = std::move(sink);
    }

    return dq_.post(
        [this, gen]()
        {
            dq_.addTimer(std::chrono::milliseconds(cfg_.advertiseDelayMs),
                         [this, gen]() { advertise_(gen); });
        });
}

void SimulatedCommissioner::stopBrowse() noexcept
{
    browseGen_.fetch_add(1);
}

void SimulatedCommissioner::advertise_(std::uint64_t browseGen)
{
    if (browseGen != browseGen_.load())
        return; // 더 새 browse 가 시작됨

    std::shared_ptr<castlink::transport::IDiscoverySink> sink;
    {
        std::lock_guard<std::mutex> lock(sinkMu_);
        sink = discoverySink_.lock();
    }
    if (!sink)
        return;

    for (std::uint32_t i = 0; i < cfg_.peerCount; ++i)
    {
        castlink::discovery::PeerRecord rec;
        rec.instanceName = std::format("SIM{:04X}{:08X}", cfg_.vendorId, i + 1);
        rec.hostName = std::format("sim-tv-{}.local", i);
        rec.deviceName = i == 0 ? cfg_.deviceName : std::format("{} #{}", cfg_.deviceName, i + 1);
        rec.vendorId = cfg_.vendorId;
        rec.productId = cfg_.productId;
        rec.deviceType = 35; // video player
        rec.longDiscriminator = static_cast<std::uint16_t>(0x100 + i);
        rec.commissioningMode = 0;
        rec.port = kCommissionedPort;
        rec.addresses = {std::format("192.168.0.{}", 10 + i)};
        rec.interfaceId = 2;
        sink->onPeerDiscovered(std::move(rec));
    }

    // 첫 피어 재광고 (엔진은 중복으로 걸러야 함)
    if (cfg_.peerCount > 0)
    {
        castlink::discovery::PeerRecord again;
        again.instanceName = std::format("SIM{:04X}{:08X}", cfg_.vendorId, 1);
        again.deviceName = cfg_.deviceName;
        again.port = kCommissionedPort;
        again.addresses = {"192.168.0.10"};
        sink->onPeerDiscovered(std::move(again));
    }
}

// ===== commissioning =====

void SimulatedCommissioner::setEventSink(std::weak_ptr<castlink::transport::ISessionEventSink> sink)
{
    std::lock_guard<std::mutex> lock(sinkMu_);
    sessionSink_ = std::move(sink);
}

bool SimulatedCommissioner::sendUserDirectedCommissioningRequest(
    const castlink::transport::UdcTarget &target, UdcDone done)
{
    if (!started_.load())
        return false;

    udcRequests_.fetch_add(1);
    CASTLINK_LOG_INFO("Sim", "UdcReceived", "addr={} port={} if={}", target.address, target.port,
                      target.interfaceId);

    return dq_.post(
        [this, done = std::move(done)]()
        {
            dq_.addTimer(std::chrono::milliseconds(cfg_.responseDelayMs),
                         [done]()
                         {
                             if (done)
                                 done(true);
                         });
        });
}

bool SimulatedCommissioner::openCommissioningWindow(std::chrono::seconds timeout)
{
    if (!started_.load())
        return false;

    windowOpen_.store(true);
    const std::uint64_t gen = windowGen_.fetch_add(1) + 1;
    CASTLINK_LOG_INFO("Sim", "WindowOpen", "gen={} timeout_s={}", gen, timeout.count());

    return dq_.post(
        [this, gen]()
        {
            dq_.addTimer(std::chrono::milliseconds(cfg_.commissioningDelayMs),
                         [this, gen]() { completeCommissioning_(gen); });
        });
}

void SimulatedCommissioner::completeCommissioning_(std::uint64_t windowGen)
{
    if (windowGen != windowGen_.load() || !windowOpen_.exchange(false))
        return;

    sessionUp_.store(true, std::memory_order_release);
    CASTLINK_LOG_INFO("Sim", "Commissioned", "gen={}", windowGen);

    if (auto sink = lockSink_())
        sink->onCommissioningComplete(castlink::Error::success());
}

// ===== session =====

bool SimulatedCommissioner::send(const MessageView &frame)
{
    if (!sessionUp_.load(std::memory_order_acquire))
        return false;

    framesReceived_.fetch_add(1);
    return dq_.post([this, bytes = frame.toBytes()]() mutable { handleFrame_(std::move(bytes)); });
}

void SimulatedCommissioner::close() noexcept
{
    windowOpen_.store(false);
    windowGen_.fetch_add(1);
    if (!sessionUp_.exchange(false))
        return;
    if (!dq_.post([this]() { endSession_(); }))
    {
        CASTLINK_LOG_DEBUG("Sim", "CloseAfterStop");
    }
}

void SimulatedCommissioner::dropSession(std::string reason)
{
    if (!sessionUp_.exchange(false))
        return;

    const bool posted = dq_.post(
        [this, reason = std::move(reason)]()
        {
            endSession_();
            if (auto sink = lockSink_())
                sink->onSessionLost(reason);
        });
    if (!posted)
        CASTLINK_LOG_WARN("Sim", "DropAfterStop");
}

void SimulatedCommissioner::endSession_()
{
    for (auto &[id, sub] : subscriptions_)
    {
        if (sub.periodicTimer != castlink::core::TimerWheel::kInvalidTimerId)
            dq_.cancelTimer(sub.periodicTimer);
    }
    subscriptions_.clear();
    CASTLINK_LOG_INFO("Sim", "SessionEnded");
}

void SimulatedCommissioner::reply_(std::vector<std::uint8_t> frame)
{
    if (!sessionUp_.load(std::memory_order_acquire))
        return;
    if (auto sink = lockSink_())
        sink->onFrameReceived(std::move(frame));
}

void SimulatedCommissioner::replyStatus_(std::uint32_t correlationId, InteractionStatus status,
                                         std::string message)
{
    castlink::protocol::StatusResponseFrame f;
    f.correlationId = correlationId;
    f.status = static_cast<std::uint8_t>(status);
    f.message = std::move(message);
    reply_(castlink::protocol::encodeFrame(f));
}

void SimulatedCommissioner::handleFrame_(std::vector<std::uint8_t> frame)
{
    using namespace castlink::protocol;

    std::uint16_t opcode = 0;
    MessageView body;
    if (!splitFrame(MessageView(frame), opcode, body))
        return;

    switch (opcode)
    {
    case kOpInvokeRequest: {
        InvokeRequestFrame req;
        if (!decodeBody(body, req))
            return;
        // 응답은 지연 후 보낸다. payload 는 원본 버퍼를 가리키므로 프레임째 들고 간다.
        dq_.addTimer(std::chrono::milliseconds(cfg_.responseDelayMs),
                     [this, frame = std::move(frame)]()
                     {
                         std::uint16_t op = 0;
                         MessageView b;
                         InvokeRequestFrame r;
                         if (splitFrame(MessageView(frame), op, b) && decodeBody(b, r))
                             handleInvoke_(r);
                     });
        return;
    }
    case kOpSubscribeRequest: {
        SubscribeRequestFrame req;
        if (decodeBody(body, req))
            handleSubscribe_(req);
        return;
    }
    case kOpSubscriptionCancel: {
        SubscriptionCancelFrame req;
        if (decodeBody(body, req))
            handleCancel_(req.correlationId);
        return;
    }
    default:
        CASTLINK_LOG_WARN("Sim", "UnknownOpcode", "opcode=0x{:04X}", opcode);
        return;
    }
}

void SimulatedCommissioner::handleInvoke_(const castlink::protocol::InvokeRequestFrame &req)
{
    const std::uint32_t id = req.correlationId;

    switch (req.clusterId)
    {
    case cl::media_playback::kClusterId: {
        namespace mp = cl::media_playback;
        std::uint8_t newState = playbackState_;
        switch (req.commandId)
        {
        case mp::Play::kCommandId:
            newState = static_cast<std::uint8_t>(mp::PlaybackState::Playing);
            break;
        case mp::Pause::kCommandId:
            newState = static_cast<std::uint8_t>(mp::PlaybackState::Paused);
            break;
        case mp::StopPlayback::kCommandId:
            newState = static_cast<std::uint8_t>(mp::PlaybackState::NotPlaying);
            positionMs_ = 0;
            break;
        case mp::Next::kCommandId:
            positionMs_ = 0;
            break;
        case mp::SkipForward::kCommandId: {
            mp::SkipForward cmd;
            if (!parseCommand(req.payload, cmd))
                return replyStatus_(id, InteractionStatus::ConstraintError);
            positionMs_ += cmd.deltaPositionMs;
            break;
        }
        case mp::SkipBackward::kCommandId: {
            mp::SkipBackward cmd;
            if (!parseCommand(req.payload, cmd))
                return replyStatus_(id, InteractionStatus::ConstraintError);
            positionMs_ = cmd.deltaPositionMs > positionMs_ ? 0 : positionMs_ - cmd.deltaPositionMs;
            break;
        }
        case mp::Seek::kCommandId: {
            mp::Seek cmd;
            if (!parseCommand(req.payload, cmd))
                return replyStatus_(id, InteractionStatus::ConstraintError);
            positionMs_ = cmd.positionMs;
            break;
        }
        default:
            return replyStatus_(id, InteractionStatus::InvalidCommand);
        }

        reply_(invokeResponse(id, mp::PlaybackResponse{}));
        if (newState != playbackState_)
        {
            playbackState_ = newState;
            notifyAttributeChanged_(mp::kClusterId, mp::CurrentState::kAttributeId);
        }
        notifyAttributeChanged_(mp::kClusterId, mp::SampledPosition::kAttributeId);
        return;
    }

    case cl::content_launcher::kClusterId: {
        namespace cnt = cl::content_launcher;
        cnt::LauncherResponse resp;
        if (req.commandId == cnt::LaunchURL::kCommandId)
        {
            cnt::LaunchURL cmd;
            if (!parseCommand(req.payload, cmd))
                return replyStatus_(id, InteractionStatus::ConstraintError);
            resp.data = "launched " + cmd.contentUrl;
        }
        else if (req.commandId == cnt::LaunchContent::kCommandId)
        {
            cnt::LaunchContent cmd;
            if (!parseCommand(req.payload, cmd))
                return replyStatus_(id, InteractionStatus::ConstraintError);
            resp.data = std::format("matched {} parameter(s)", cmd.search.parameters.size());
        }
        else
        {
            return replyStatus_(id, InteractionStatus::InvalidCommand);
        }
        reply_(invokeResponse(id, resp));
        return;
    }

    case cl::level_control::kClusterId: {
        namespace lc = cl::level_control;
        if (req.commandId == lc::MoveToLevel::kCommandId)
        {
            lc::MoveToLevel cmd;
            if (!parseCommand(req.payload, cmd))
                return replyStatus_(id, InteractionStatus::ConstraintError);
            level_ = cmd.level;
        }
        else if (req.commandId == lc::Step::kCommandId)
        {
            lc::Step cmd;
            if (!parseCommand(req.payload, cmd))
                return replyStatus_(id, InteractionStatus::ConstraintError);
            const int next = cmd.stepMode == lc::StepMode::Up ? level_ + cmd.stepSize
                                                               : level_ - cmd.stepSize;
            level_ = static_cast<std::uint8_t>(next < 0 ? 0 : (next > 254 ? 254 : next));
        }
        else
        {
            return replyStatus_(id, InteractionStatus::InvalidCommand);
        }
        replyStatus_(id, InteractionStatus::Success);
        notifyAttributeChanged_(lc::kClusterId, lc::CurrentLevel::kAttributeId);
        return;
    }

    case cl::application_launcher::kClusterId: {
        namespace al = cl::application_launcher;
        al::Application app;
        if (req.commandId == al::LaunchApp::kCommandId)
        {
            al::LaunchApp cmd;
            if (!parseCommand(req.payload, cmd))
                return replyStatus_(id, InteractionStatus::ConstraintError);
            app = cmd.application;
        }
        else if (req.commandId == al::StopApp::kCommandId ||
                 req.commandId == al::HideApp::kCommandId)
        {
            al::StopApp cmd;
            if (!parseCommand(req.payload, cmd))
                return replyStatus_(id, InteractionStatus::ConstraintError);
            app = cmd.application;
        }
        else
        {
            return replyStatus_(id, InteractionStatus::InvalidCommand);
        }
        al::LauncherResponse resp;
        resp.data = std::format("{}:{}", app.catalogVendorId, app.applicationId);
        reply_(invokeResponse(id, resp));
        return;
    }

    case cl::target_navigator::kClusterId: {
        namespace tn = cl::target_navigator;
        tn::NavigateTarget cmd;
        if (req.commandId != tn::NavigateTarget::kCommandId)
            return replyStatus_(id, InteractionStatus::InvalidCommand);
        if (!parseCommand(req.payload, cmd))
            return replyStatus_(id, InteractionStatus::ConstraintError);

        tn::NavigateTargetResponse resp;
        if (cmd.target >= simTargets().size())
        {
            resp.status = 1; // TargetNotFound
        }
        else
        {
            currentTarget_ = cmd.target;
            notifyAttributeChanged_(tn::kClusterId, tn::CurrentTarget::kAttributeId);
        }
        reply_(invokeResponse(id, resp));
        return;
    }

    case cl::keypad_input::kClusterId: {
        namespace kp = cl::keypad_input;
        kp::SendKey cmd;
        if (req.commandId != kp::SendKey::kCommandId)
            return replyStatus_(id, InteractionStatus::InvalidCommand);
        if (!parseCommand(req.payload, cmd))
            return replyStatus_(id, InteractionStatus::ConstraintError);
        reply_(invokeResponse(id, kp::SendKeyResponse{}));
        return;
    }

    default:
        replyStatus_(id, InteractionStatus::UnsupportedCluster,
                     std::format("cluster 0x{:04X}", req.clusterId));
        return;
    }
}

bool SimulatedCommissioner::encodeAttribute_(std::uint32_t clusterId, std::uint32_t attributeId,
                                             PacketWriter &w) const
{
    namespace cnt = cl::content_launcher;
    namespace lc = cl::level_control;
    namespace mp = cl::media_playback;
    namespace tn = cl::target_navigator;
    namespace ab = cl::application_basic;

    switch (clusterId)
    {
    case cnt::kClusterId:
        if (attributeId == cnt::SupportedStreamingProtocols::kAttributeId)
            return writeAttr<cnt::SupportedStreamingProtocols>(
                w, cnt::SupportedStreamingProtocols::kDash | cnt::SupportedStreamingProtocols::kHls);
        return false;

    case lc::kClusterId:
        switch (attributeId)
        {
        case lc::CurrentLevel::kAttributeId:
            return writeAttr<lc::CurrentLevel>(w, level_);
        case lc::MinLevel::kAttributeId:
            return writeAttr<lc::MinLevel>(w, 1);
        case lc::MaxLevel::kAttributeId:
            return writeAttr<lc::MaxLevel>(w, 254);
        default:
            return false;
        }

    case mp::kClusterId:
        switch (attributeId)
        {
        case mp::CurrentState::kAttributeId:
            return writeAttr<mp::CurrentState>(w, static_cast<mp::PlaybackState>(playbackState_));
        case mp::StartTime::kAttributeId:
            return writeAttr<mp::StartTime>(w, std::uint64_t{0});
        case mp::Duration::kAttributeId:
            return writeAttr<mp::Duration>(w, std::uint64_t{3'600'000});
        case mp::SampledPosition::kAttributeId:
            return writeAttr<mp::SampledPosition>(w, mp::PlaybackPosition{0, positionMs_});
        case mp::PlaybackSpeed::kAttributeId:
            return writeAttr<mp::PlaybackSpeed>(w, playbackState_ == 0 ? 1.0f : 0.0f);
        case mp::SeekRangeEnd::kAttributeId:
            return writeAttr<mp::SeekRangeEnd>(w, std::uint64_t{3'600'000});
        case mp::SeekRangeStart::kAttributeId:
            return writeAttr<mp::SeekRangeStart>(w, std::uint64_t{0});
        default:
            return false;
        }

    case tn::kClusterId:
        if (attributeId == tn::TargetList::kAttributeId)
            return writeAttr<tn::TargetList>(w, simTargets());
        if (attributeId == tn::CurrentTarget::kAttributeId)
            return writeAttr<tn::CurrentTarget>(w, currentTarget_);
        return false;

    case ab::kClusterId:
        switch (attributeId)
        {
        case ab::VendorName::kAttributeId:
            return writeAttr<ab::VendorName>(w, std::string("castlink sim"));
        case ab::VendorID::kAttributeId:
            return writeAttr<ab::VendorID>(w, cfg_.vendorId);
        case ab::ApplicationName::kAttributeId:
            return writeAttr<ab::ApplicationName>(w, cfg_.deviceName);
        case ab::ProductID::kAttributeId:
            return writeAttr<ab::ProductID>(w, cfg_.productId);
        case ab::ApplicationVersion::kAttributeId:
            return writeAttr<ab::ApplicationVersion>(w, std::string("1.0.0"));
        default:
            return false;
        }

    default:
        return false;
    }
}

bool SimulatedCommissioner::sendReport_(const SimSubscription &sub)
{
    PacketWriter value;
    if (!encodeAttribute_(sub.clusterId, sub.attributeId, value))
        return false;

    castlink::protocol::ReportDataFrame f;
    f.correlationId = sub.correlationId;
    f.clusterId = sub.clusterId;
    f.attributeId = sub.attributeId;
    f.payload = value.view();
    reply_(castlink::protocol::encodeFrame(f));
    return true;
}

void SimulatedCommissioner::handleSubscribe_(const castlink::protocol::SubscribeRequestFrame &req)
{
    SimSubscription sub;
    sub.correlationId = req.correlationId;
    sub.clusterId = req.clusterId;
    sub.attributeId = req.attributeId;
    sub.maxIntervalS = req.maxIntervalS == 0 ? 1 : req.maxIntervalS;

    // priming report 가 SubscribeResponse 보다 먼저 나간다.
    if (!sendReport_(sub))
    {
        replyStatus_(req.correlationId, InteractionStatus::UnsupportedAttribute,
                     std::format("attribute 0x{:04X}/0x{:04X}", req.clusterId, req.attributeId));
        return;
    }

    castlink::protocol::SubscribeResponseFrame resp;
    resp.correlationId = req.correlationId;
    resp.maxIntervalS = sub.maxIntervalS;
    reply_(castlink::protocol::encodeFrame(resp));

    if (auto old = subscriptions_.find(sub.correlationId); old != subscriptions_.end())
        dq_.cancelTimer(old->second.periodicTimer);
    auto it = subscriptions_.insert_or_assign(sub.correlationId, sub).first;
    schedulePeriodic_(it->second);
}

void SimulatedCommissioner::schedulePeriodic_(SimSubscription &sub)
{
    const std::uint32_t id = sub.correlationId;
    sub.periodicTimer = dq_.addTimer(std::chrono::seconds(sub.maxIntervalS),
                                     [this, id]()
                                     {
                                         auto it = subscriptions_.find(id);
                                         if (it == subscriptions_.end())
                                             return;
                                         sendReport_(it->second);
                                         schedulePeriodic_(it->second);
                                     });
}

void SimulatedCommissioner::notifyAttributeChanged_(std::uint32_t clusterId,
                                                    std::uint32_t attributeId)
{
    for (auto &[id, sub] : subscriptions_)
    {
        if (sub.clusterId != clusterId || sub.attributeId != attributeId)
            continue;
        sendReport_(sub);
        // 변경 report 도 max interval 카운트를 새로 시작한다.
        dq_.cancelTimer(sub.periodicTimer);
        schedulePeriodic_(sub);
    }
}

void SimulatedCommissioner::handleCancel_(std::uint32_t correlationId)
{
    auto it = subscriptions_.find(correlationId);
    if (it == subscriptions_.end())
        return;
    dq_.cancelTimer(it->second.periodicTimer);
    subscriptions_.erase(it);
    CASTLINK_LOG_DEBUG("Sim", "SubscriptionCancelled", "id={}", correlationId);
}

} // namespace casting::sim
