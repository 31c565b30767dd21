#pragma once
//
// DataFrame -> DataFrame transform seam
//
#include "transform_configuration.h"
#include <epoch_frame/dataframe.h>
#include <memory>
#include <ostream>

namespace topline::transform {
struct ITransformBase {

  virtual std::string GetId() const = 0;

  virtual std::string GetName() const = 0;

  virtual const TransformConfiguration &GetConfiguration() const = 0;

  // Stateless: identical input always yields identical output
  virtual epoch_frame::DataFrame
  TransformData(const epoch_frame::DataFrame &) const = 0;

  virtual ~ITransformBase() = default;
};

class ITransform : public ITransformBase {

public:
  explicit ITransform(TransformConfiguration config)
      : m_config(std::move(config)) {}

  std::string GetId() const final { return m_config.GetId(); }

  inline std::string GetName() const final {
    return m_config.GetTransformName();
  }

  const TransformConfiguration &GetConfiguration() const final {
    return m_config;
  }

  friend std::ostream &operator<<(std::ostream &os, ITransform const &model) {
    os << model.m_config.ToString();
    return os;
  }

  ~ITransform() override = default;
  using Ptr = std::shared_ptr<ITransform>;

protected:
  const ReportConfig &GetReportConfig() const {
    return m_config.GetReportConfig();
  }

  TransformConfiguration m_config;
};

using ITransformBasePtr = std::unique_ptr<ITransformBase>;
} // namespace topline::transform
