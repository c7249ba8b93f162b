#include <railtriage/app/engine_builder.hpp>
#include <railtriage/media/mock_ocr_engine.hpp>
#include <railtriage/media/time_bounded_ocr_engine.hpp>
#include <railtriage/nlp/keyword_text_model.hpp>
#include <railtriage/nlp/onnx_text_model.hpp>
#ifdef RAILTRIAGE_HAS_TESSERACT
#include <railtriage/media/tesseract_ocr_engine.hpp>
#endif
#include <onnxruntime_cxx_api.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace railtriage::app {

namespace {

std::shared_ptr<nlp::ITextModel> make_model(const TriageConfig& cfg,
                                            const nlp::TextVectorizer& vectorizer) {
  if (cfg.model_backend == ModelBackendType::Keyword) {
    return std::make_shared<nlp::KeywordTextModel>();
  }
  try {
    auto onnx = std::make_shared<nlp::OnnxTextModel>(cfg.model_path, vectorizer);
    onnx->warmup();
    return onnx;
  } catch (const Ort::Exception& e) {
    spdlog::error("could not load ONNX model '{}': {}", cfg.model_path, e.what());
  } catch (const std::runtime_error& e) {
    spdlog::error("ONNX model '{}' rejected: {}", cfg.model_path, e.what());
  }
  return nullptr;
}

std::shared_ptr<media::IOcrEngine> make_ocr(const TriageConfig& cfg) {
  switch (cfg.ocr_backend) {
    case OcrBackendType::None:
      return nullptr;
    case OcrBackendType::Mock:
      return std::make_shared<media::MockOcrEngine>();
    case OcrBackendType::Tesseract:
#ifdef RAILTRIAGE_HAS_TESSERACT
      try {
        return std::make_shared<media::TesseractOcrEngine>(cfg.ocr_language, cfg.tessdata_path);
      } catch (const std::runtime_error& e) {
        spdlog::warn("OCR disabled: {}", e.what());
        return nullptr;
      }
#else
      spdlog::warn("OCR disabled: built without Tesseract (RAILTRIAGE_USE_TESSERACT=OFF)");
      return nullptr;
#endif
  }
  return nullptr;
}

}  // namespace

TriageEngine build_engine(const TriageConfig& config,
                          std::shared_ptr<core::IDecisionSink> sink,
                          std::shared_ptr<media::IOcrEngine> ocr_override) {
  if (!validate_config(config)) {
    throw std::invalid_argument("build_engine: invalid configuration");
  }

  nlp::TextVectorizer vectorizer(config.vector_dims);

  auto ocr = ocr_override ? std::move(ocr_override) : make_ocr(config);
  if (ocr) {
    auto ocr_pool = std::make_shared<core::TaskExecutor>(config.inference_workers);
    ocr = std::make_shared<media::TimeBoundedOcrEngine>(
        std::move(ocr), std::move(ocr_pool), std::chrono::milliseconds(config.ocr_timeout_ms));
  }

  media::FeatureExtractorOptions fx;
  fx.location_aliases = nlp::make_alias_map(config.location_aliases);
  fx.max_media_bytes = config.max_media_bytes;

  nlp::ClassifierOptions co;
  co.confidence_threshold = config.confidence_threshold;
  co.default_urgency = config.default_urgency;

  dedup::DedupOptions dd;
  dd.match_distance = config.match_distance;
  dd.unknown_location_match_distance = config.unknown_location_match_distance;
  dd.centroid_alpha = config.centroid_alpha;
  dd.lock_timeout = std::chrono::milliseconds(config.store_timeout_ms);

  TriageEngine engine;
  engine.store = std::make_shared<dedup::InMemoryClusterStore>();

  TriageComponents parts;
  parts.extractor = std::make_shared<media::FeatureExtractor>(ocr, vectorizer, std::move(fx));
  parts.classifier = std::make_shared<nlp::Classifier>(
      make_model(config, vectorizer), nlp::UrgencyScorer(config.urgency_weights), co);
  parts.deduplicator = std::make_shared<dedup::Deduplicator>(engine.store, dd);
  parts.router = std::make_shared<routing::Router>(config.routing);
  parts.executor = std::make_shared<core::TaskExecutor>(config.inference_workers);
  parts.sink = std::move(sink);

  TriageOptions opts;
  opts.latency_budget = std::chrono::milliseconds(config.latency_budget_ms);
  opts.classifier_timeout = std::chrono::milliseconds(config.classifier_timeout_ms);
  opts.classifier_fallback = config.classifier_fallback;

  spdlog::info("railtriage engine: model={}, ocr={}, workers={}, budget={} ms",
               parts.classifier->model_name(), ocr ? ocr->name() : std::string("none"),
               config.inference_workers, config.latency_budget_ms);
  engine.orchestrator = std::make_unique<TriageOrchestrator>(std::move(parts), opts);

  dedup::AgingOptions aging;
  aging.inactivity_window = std::chrono::duration_cast<core::SystemClock::duration>(
      std::chrono::duration<double, std::ratio<3600>>(config.inactivity_window_hours));
  aging.interval = std::chrono::seconds(config.sweep_interval_s);
  aging.lock_timeout = dd.lock_timeout;
  engine.aging = std::make_unique<dedup::ClusterAgingScheduler>(engine.store, aging);
  return engine;
}

}  // namespace railtriage::app
