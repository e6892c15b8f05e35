/* @file SweepProtocol.cpp
 * @brief per-point send / dwell / max-hold / peak / marker sequencing with step isolation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <sstream>
#include <utility>

// rfsweep headers
#include "core/Clock.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/RunConfig.hpp"
#include "instruments/Analyzer.hpp"
#include "io/UdpSession.hpp"
#include "protocols/FieldCodec.hpp"
#include "protocols/SweepAxis.hpp"
#include "protocols/SweepProtocol.hpp"

namespace rfsweep::protocols {

  namespace {
    constexpr const char* kSource = "SweepProtocol";

    /// Closes the session when the run scope unwinds, normal exit or not.
    class SessionRelease {
    public:
      explicit SessionRelease(io::DatagramTransport& t) : transport_(t) {}
      ~SessionRelease() { transport_.close(); }

      SessionRelease(const SessionRelease&) = delete;
      SessionRelease& operator=(const SessionRelease&) = delete;

    private:
      io::DatagramTransport& transport_;
    };

    ProgressEvent makeEvent(const core::RunConfig& cfg, ProgressStatus status, int current,
                            std::string message) {
      ProgressEvent ev;
      ev.status = status;
      ev.current = current;
      ev.total = cfg.declaredTotal;
      ev.boardNo = cfg.boardNo;
      ev.channelNo = cfg.channelNo;
      ev.message = std::move(message);
      return ev;
    }
  } // namespace

  const char* toString(SweepProtocol::State s) {
    using State = SweepProtocol::State;
    switch (s) {
    case State::Idle:
      return "Idle";
    case State::Configuring:
      return "Configuring";
    case State::Resetting:
      return "Resetting";
    case State::Sending:
      return "Sending";
    case State::Dwelling:
      return "Dwelling";
    case State::Holding:
      return "Holding";
    case State::PeakSearching:
      return "PeakSearching";
    case State::Reading:
      return "Reading";
    case State::Recording:
      return "Recording";
    case State::Completed:
      return "Completed";
    default:
      return "Unknown";
    }
  }

  SweepProtocol::SweepProtocol(std::shared_ptr<instruments::Analyzer> analyzer,
                               std::shared_ptr<core::Clock> clock, TransportFactory transports,
                               std::shared_ptr<core::ErrorMonitor> errorMonitor,
                               std::shared_ptr<core::Logger> logger)
      : analyzer_(std::move(analyzer)), clock_(std::move(clock)),
        transports_(std::move(transports)), errorMonitor_(std::move(errorMonitor)),
        logger_(std::move(logger)) {
    if (!clock_)
      clock_ = std::make_shared<core::SteadyClock>();
    if (!transports_)
      transports_ = [] { return std::make_unique<io::UdpSession>(); };
  }

  SweepProtocol::~SweepProtocol() = default;

  void SweepProtocol::setProgressSink(ProgressSink sink) { sink_ = std::move(sink); }

  void SweepProtocol::clearProgressSink() { sink_ = nullptr; }

  std::vector<MeasurementResult> SweepProtocol::run(const core::RunConfig& cfg,
                                                    const core::CancellationToken* cancel) {
    if (!analyzer_)
      throw core::ConfigurationError("Analyzer must be attached before running a sweep");

    transitionTo(State::Idle);
    transitionTo(State::Configuring);

    std::vector<MeasurementResult> results;
    bool cancelled = false;

    try {
      const PacketBuilder builder = configure(cfg);
      const SweepAxis axis(cfg.sweep.start, cfg.sweep.stop, cfg.sweep.step);

      auto transport = transports_();
      transport->bind(cfg.udpSource);
      SessionRelease release(*transport);

      log(core::LogLevel::Info, "run start: board " + std::to_string(cfg.boardNo) + " channel " +
                                    std::to_string(cfg.channelNo) + ", " +
                                    std::to_string(axis.size()) + " points to " +
                                    io::toString(cfg.udpDestination));

      emit(makeEvent(cfg, ProgressStatus::Running, 0, "Starting automation sequence..."));

      analyzer_->setCenterFrequency(cfg.analyzer.centerHz);
      analyzer_->setSpan(cfg.analyzer.spanHz);
      analyzer_->setResolutionBandwidth(cfg.analyzer.rbwHz);

      const auto values = axis.values();
      for (std::size_t i = 0; i < values.size(); ++i) {
        if (cancel && cancel->cancelled()) {
          cancelled = true;
          log(core::LogLevel::Warning, "run cancelled before point " + std::to_string(i + 1));
          break;
        }

        const std::uint8_t spot = values[i];
        const int step = static_cast<int>(i) + 1;
        const std::string label = hexLabel(spot);
        const std::string hex = "0x" + label;

        const Payload payload = builder.build(spot);

        transitionTo(State::Resetting);
        isolated("trace reset", [this] { analyzer_->resetTrace(); });
        clock_->sleepFor(cfg.dwell.settle);

        transitionTo(State::Sending);
        ProgressEvent sending = makeEvent(cfg, ProgressStatus::Running, step, "Sending spot " + hex);
        sending.hex = hex;
        emit(sending);

        try {
          transport->send(payload, cfg.udpDestination);
        } catch (const core::TransportError& e) {
          stepFailed(cfg, step, hex, std::string("UDP send failed: ") + e.what());
          continue;
        }
        log(core::LogLevel::Debug, "Payload (hex): " + encodeHex(payload));

        transitionTo(State::Dwelling);
        clock_->sleepFor(cfg.dwell.afterSend);

        transitionTo(State::Holding);
        isolated("max hold", [this] { analyzer_->holdMaxTrace(); });
        clock_->sleepFor(cfg.dwell.maxHold);

        transitionTo(State::PeakSearching);
        isolated("peak search", [this] { analyzer_->peakSearch(); });
        clock_->sleepFor(cfg.dwell.peakSearch);

        transitionTo(State::Reading);
        double freqHz = 0.0;
        double powerDbm = 0.0;
        try {
          freqHz = analyzer_->readMarkerFrequency();
          powerDbm = analyzer_->readMarkerPower();
        } catch (const std::exception& e) {
          stepFailed(cfg, step, hex, std::string("Analyzer read failed: ") + e.what());
          continue;
        }

        transitionTo(State::Recording);
        results.push_back(MeasurementResult{ label, freqHz, powerDbm });
      }
    } catch (const std::exception& e) {
      log(core::LogLevel::Error, std::string("run aborted: ") + e.what());
      transitionTo(State::Idle);
      throw;
    }

    transitionTo(State::Completed);

    std::ostringstream msg;
    msg << "Automation completed: " << results.size() << "/" << cfg.declaredTotal
        << " measurements successful";
    if (cancelled)
      msg << " (cancelled)";

    log(core::LogLevel::Info, msg.str());
    emit(makeEvent(cfg, ProgressStatus::Completed, static_cast<int>(results.size()), msg.str()));

    return results;
  }

  PacketBuilder SweepProtocol::configure(const core::RunConfig& cfg) const {
    const FieldSpec pulse = pulseWidthField(cfg.pulseOffsets);
    const FieldSpec prt = prtField(cfg.prtOffsets);

    // arity first: a wrong offset list is a configuration problem, not bad input
    for (const FieldSpec* spec : { &pulse, &prt }) {
      if (spec->offsets.size() != spec->byteLength)
        throw core::ConfigurationError(spec->name + " offsets must be a list of " +
                                       std::to_string(spec->byteLength) + " integers");
    }

    Bytes pulseBytes = decodeHex(cfg.pulseWidth, pulse.byteLength);
    Bytes prtBytes = decodeHex(cfg.prt, prt.byteLength);

    PacketBuilder builder(kDefaultTemplate, cfg.sweepOffset);
    builder.addField(pulse, std::move(pulseBytes));
    builder.addField(prt, std::move(prtBytes));

    if (const auto overlaps = builder.overlappingOffsets(); !overlaps.empty()) {
      std::string list;
      for (int o : overlaps)
        list += (list.empty() ? "" : ",") + std::to_string(o);
      log(core::LogLevel::Warning,
          "offset(s) " + list + " written more than once; later fields win, sweep byte last");
    }
    return builder;
  }

  void SweepProtocol::isolated(const char* what, const std::function<void()>& call) {
    try {
      call();
    } catch (const std::exception& e) {
      log(core::LogLevel::Warning, std::string(what) + " ignored: " + e.what());
    } catch (...) {
      log(core::LogLevel::Warning, std::string(what) + " ignored: non-standard exception");
    }
  }

  void SweepProtocol::emit(const ProgressEvent& event) {
    if (!sink_)
      return;
    try {
      sink_(event);
    } catch (const std::exception& e) {
      log(core::LogLevel::Warning, std::string("progress sink threw: ") + e.what());
    } catch (...) {
      log(core::LogLevel::Warning, "progress sink threw a non-standard exception");
    }
  }

  void SweepProtocol::stepFailed(const core::RunConfig& cfg, int step, const std::string& hex,
                                 const std::string& message) {
    log(core::LogLevel::Error, "spot " + hex + ": " + message);
    if (errorMonitor_)
      errorMonitor_->notifyFailure("[SweepProtocol] spot " + hex + ": " + message);

    ProgressEvent event = makeEvent(cfg, ProgressStatus::Error, step, message);
    event.hex = hex;
    emit(event);
  }

  void SweepProtocol::transitionTo(State next) { state_ = next; }

  void SweepProtocol::log(core::LogLevel level, const std::string& message) const {
    if (logger_)
      logger_->log(level, kSource, message);
  }

} // namespace rfsweep::protocols
