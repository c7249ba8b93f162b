#include "triage_stages.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace railtriage::app::detail {

namespace {

/// Polling slice while waiting on the classifier, so cancellation is noticed promptly.
constexpr std::chrono::milliseconds kWaitSlice{5};

}  // namespace

ExtractStage::ExtractStage(std::shared_ptr<media::FeatureExtractor> extractor)
    : extractor_(std::move(extractor)) {}

std::expected<void, core::TriageError> ExtractStage::process(core::TriageContext& ctx) {
  if (!ctx.input) return std::unexpected(core::TriageError::InvalidInput);
  ctx.bundle = extractor_->extract(*ctx.input);
  ctx.bundle.observed_at = ctx.received_at;
  return {};
}

ClassifyStage::ClassifyStage(std::shared_ptr<nlp::Classifier> classifier,
                             std::shared_ptr<core::TaskExecutor> executor,
                             TriageOptions options)
    : classifier_(std::move(classifier)), executor_(std::move(executor)), options_(options) {}

void ClassifyStage::fall_back(core::TriageContext& ctx, std::string note) const {
  core::ClassificationResult r;
  r.category = core::Category::Other;
  r.model_category = core::Category::Other;
  r.confidence = 0.f;
  r.below_threshold = true;
  r.urgency = classifier_->options().default_urgency;
  ctx.classification = r;
  ctx.classifier_fallback = true;
  ctx.notes.push_back(std::move(note));
}

std::expected<void, core::TriageError> ClassifyStage::process(core::TriageContext& ctx) {
  ctx.model_name = classifier_->model_name();

  std::expected<core::ClassificationResult, core::TriageError> result;
  if (!executor_) {
    result = classifier_->classify(ctx.bundle);
  } else {
    auto classifier = classifier_;
    auto bundle = std::make_shared<const core::FeatureBundle>(ctx.bundle);
    auto job = executor_->submit_abandonable(
        [classifier, bundle]() { return classifier->classify(*bundle); });
    auto& fut = job.future;

    const auto limit = std::min(options_.classifier_timeout, ctx.remaining());
    const auto wait_until = std::chrono::steady_clock::now() + limit;
    bool ready = false;
    while (!ready) {
      const auto now = std::chrono::steady_clock::now();
      if (now >= wait_until) break;
      const auto step = std::min<std::chrono::steady_clock::duration>(kWaitSlice, wait_until - now);
      ready = fut.wait_for(step) == std::future_status::ready;
      if (!ready && ctx.cancel_requested()) {
        job.abandon();
        return std::unexpected(core::TriageError::Cancelled);
      }
    }
    if (!ready) {
      ready = fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
    if (!ready) {
      job.abandon();
      spdlog::warn("classification of complaint {} exceeded {} ms; using fallback",
                   ctx.complaint_id, limit.count());
      fall_back(ctx, "classifier timed out");
      return {};
    }
    result = fut.get();
  }

  if (result) {
    ctx.classification = *result;
    return {};
  }
  if (options_.classifier_fallback) {
    spdlog::warn("classifier unavailable for complaint {} ({}); using fallback",
                 ctx.complaint_id, core::to_string(result.error()));
    fall_back(ctx, "classifier unavailable: " + std::string(core::to_string(result.error())));
    return {};
  }
  spdlog::error("classifier unavailable for complaint {} ({})", ctx.complaint_id,
                core::to_string(result.error()));
  return std::unexpected(result.error());
}

DedupStage::DedupStage(std::shared_ptr<dedup::Deduplicator> deduplicator)
    : deduplicator_(std::move(deduplicator)) {}

std::expected<void, core::TriageError> DedupStage::process(core::TriageContext& ctx) {
  if (!deduplicator_) {
    ctx.dedup = core::DedupOutcome{};
    ctx.dedup.degraded = true;
    ctx.notes.emplace_back("deduplication disabled");
    return {};
  }
  ctx.dedup = deduplicator_->match_or_create(ctx.classification.category,
                                             ctx.bundle.location_token, ctx.bundle.embedding,
                                             ctx.complaint_id, ctx.bundle.submitted_at);
  if (ctx.dedup.degraded) ctx.notes.emplace_back("cluster store unavailable");
  return {};
}

RouteStage::RouteStage(std::shared_ptr<routing::Router> router) : router_(std::move(router)) {}

std::expected<void, core::TriageError> RouteStage::process(core::TriageContext& ctx) {
  const auto& cls = ctx.classification;
  const auto& dd = ctx.dedup;
  routing::RecurrenceInfo recurrence;
  recurrence.is_new_cluster = dd.is_new_cluster;
  recurrence.member_count = dd.cluster ? dd.cluster->member_count : 1;

  auto routed = router_->route(cls.category, cls.urgency, recurrence, ctx.bundle.submitted_at);
  if (!routed) return std::unexpected(routed.error());
  ctx.routing = *routed;

  core::ComplaintDecision& d = ctx.decision;
  d.complaint_id = ctx.complaint_id;
  d.category = cls.category;
  d.urgency = routed->effective_urgency;
  d.department = routed->department;
  d.sla_deadline = routed->sla_deadline;
  d.is_new_cluster = dd.is_new_cluster;
  if (dd.cluster) {
    d.cluster_id = dd.cluster->id;
    d.cluster_member_count = dd.cluster->member_count;
    if (!dd.is_new_cluster) d.duplicate_of = dd.cluster->id;
  }
  d.confidence = cls.confidence;
  d.model_category = cls.model_category;
  d.model_name = ctx.model_name;
  d.urgency_escalated = routed->escalated;
  d.urgency_factors = cls.urgency_factors;
  d.sentiment = ctx.bundle.sentiment;
  d.location_token = ctx.bundle.location_token;
  d.submitted_at = ctx.bundle.submitted_at;

  d.quality.ocr_degraded = ctx.bundle.ocr_degraded;
  d.quality.media_degraded = ctx.bundle.media_degraded;
  d.quality.classifier_fallback = ctx.classifier_fallback;
  d.quality.dedup_degraded = dd.degraded;
  d.quality.notes = ctx.bundle.notes;
  d.quality.notes.insert(d.quality.notes.end(), ctx.notes.begin(), ctx.notes.end());
  return {};
}

PublishStage::PublishStage(std::shared_ptr<core::IDecisionSink> sink) : sink_(std::move(sink)) {}

std::expected<void, core::TriageError> PublishStage::process(core::TriageContext& ctx) {
  const auto elapsed = std::chrono::steady_clock::now() - ctx.started;
  ctx.decision.processing_ms =
      std::chrono::duration<double, std::milli>(elapsed).count();

  if (sink_) {
    auto published = sink_->publish(ctx.decision);
    if (!published) {
      spdlog::error("decision for complaint {} could not be stored ({})", ctx.complaint_id,
                    core::to_string(published.error()));
      return std::unexpected(core::TriageError::StorageUnavailable);
    }
  }
  spdlog::debug("complaint {} -> {} / {} urgency {:.2f}{}", ctx.complaint_id,
                core::to_string(ctx.decision.category), core::to_string(ctx.decision.department),
                ctx.decision.urgency, ctx.decision.duplicate_of ? " (recurring)" : "");
  return {};
}

}  // namespace railtriage::app::detail
