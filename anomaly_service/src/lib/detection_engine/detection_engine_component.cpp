#include "detection_engine_component.hpp"

#include <userver/logging/log.hpp>
#include <userver/yaml_config/merge_schemas.hpp>

namespace gl_anomaly {

DetectionEngineComponent::DetectionEngineComponent(
    const userver::components::ComponentConfig& config,
    const userver::components::ComponentContext& context)
    : userver::components::ComponentBase{config, context},
      config_(config["detection"].As<DetectionConfig>()) {
    // Unknown time zones are rejected at startup
    PostingCalendar calendar(config_.timezone);

    LOG_INFO() << "GL anomaly detection configured: timezone " << calendar.Timezone()
               << ", outlier method " << ToString(config_.outliers.method)
               << ", benford " << (config_.benford.enabled ? "on" : "off")
               << ", behavioral " << (config_.behavioral.enabled ? "on" : "off")
               << ", velocity " << (config_.velocity.enabled ? "on" : "off");
}

std::unique_ptr<DetectionEngine> DetectionEngineComponent::CreateEngine(const GLDataSource& data_source) const {
    return MakeDetectionEngine(config_, data_source);
}

userver::yaml_config::Schema DetectionEngineComponent::GetStaticConfigSchema() {
    return userver::yaml_config::MergeSchemas<userver::components::ComponentBase>(R"(
type: object
description: GL anomaly detection engine
additionalProperties: false
properties:
    detection:
        type: object
        description: detector settings
        additionalProperties: false
        properties:
            timezone:
                type: string
                description: IANA time zone of posting dates and times
            benford-law:
                type: object
                description: first-digit analysis per GL account
                additionalProperties: false
                properties:
                    enabled:
                        type: boolean
                        description: run Benford analysis
                    min-transactions:
                        type: integer
                        description: accounts with fewer line items are skipped
                    significance-level:
                        type: number
                        description: p-value below which an account is anomalous
            statistical-outliers:
                type: object
                description: unusual amounts per GL account
                additionalProperties: false
                properties:
                    enabled:
                        type: boolean
                        description: run outlier detection
                    method:
                        type: string
                        description: z-score, iqr or mad
                    z-score-threshold:
                        type: number
                        description: absolute z-score above which an amount is flagged
                    iqr-multiplier:
                        type: number
                        description: fence width in interquartile ranges
                    mad-threshold:
                        type: number
                        description: modified z-score above which an amount is flagged
                    min-account-transactions:
                        type: integer
                        description: accounts with fewer line items are skipped
                    max-per-account:
                        type: integer
                        description: highest scoring outliers reported per account
            behavioral-anomalies:
                type: object
                description: posting behavior rules
                additionalProperties: false
                properties:
                    enabled:
                        type: boolean
                        description: run behavioral rules
                    check-after-hours:
                        type: boolean
                        description: flag postings inside the after-hours window
                    after-hours-start:
                        type: integer
                        description: first after-hours hour, 0..23
                    after-hours-end:
                        type: integer
                        description: first business hour, 0..23
                    check-weekends:
                        type: boolean
                        description: flag postings on Saturday and Sunday
                    check-reversals:
                        type: boolean
                        description: flag quickly reversed documents
                    same-day-reversal-window-hours:
                        type: number
                        description: maximum hours between posting and reversal
            velocity-analysis:
                type: object
                description: per period volume changes
                additionalProperties: false
                properties:
                    enabled:
                        type: boolean
                        description: run velocity analysis
                    deviation-threshold:
                        type: number
                        description: percent deviation from the trailing average
                    lookback-periods:
                        type: integer
                        description: preceding periods in the trailing average
            round-numbers:
                type: object
                description: exact round amount patterns
                additionalProperties: false
                properties:
                    enabled:
                        type: boolean
                        description: run round number detection
                    thresholds:
                        type: array
                        description: amounts considered suspiciously round
                        items:
                            type: number
                            description: round amount
                    min-occurrences:
                        type: integer
                        description: round amounts needed to flag an account
            duplicate-detection:
                type: object
                description: near identical postings
                additionalProperties: false
                properties:
                    enabled:
                        type: boolean
                        description: run duplicate detection
                    time-window-hours:
                        type: number
                        description: maximum hours between duplicates
                    amount-tolerance:
                        type: number
                        description: relative amount difference still treated as equal
                    require-matching-description:
                        type: boolean
                        description: duplicates must also share the description
)");
}

}  // namespace gl_anomaly
