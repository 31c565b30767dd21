#pragma once
//
// normalize -> cube -> filter -> project
//
#include <topline/transforms/core/itransform.h>
#include <epoch_frame/dataframe.h>

namespace topline::transform {

/**
 * @brief Reshapes a topline summary into the historical dashboard layout
 *
 * Stateless and deterministic: the same summary and configuration always
 * produce the same frame, row order included.
 *
 * @throws SchemaMismatchError if the summary does not carry the configured
 *         input schema
 * @throws ConfigurationError if the configuration is invalid
 */
epoch_frame::DataFrame ReformatData(epoch_frame::DataFrame const &summary,
                                    ReportConfig const &config);

class ReformatTransform final : public ITransform {
public:
  explicit ReformatTransform(TransformConfiguration const &config);

  [[nodiscard]] epoch_frame::DataFrame
  TransformData(epoch_frame::DataFrame const &summary) const override;
};

} // namespace topline::transform
