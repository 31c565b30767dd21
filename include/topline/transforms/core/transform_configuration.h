#pragma once
//
// Identity and report tables handed to every transform
//
#include <topline/core/report_config.h>
#include <memory>
#include <string>
#include <utility>

namespace topline::transform {
class TransformConfiguration {

public:
  TransformConfiguration(std::string id, std::string type,
                         ReportConfig reportConfig)
      : m_id(std::move(id)), m_type(std::move(type)),
        m_reportConfig(std::make_shared<const ReportConfig>(
            std::move(reportConfig))) {
    m_reportConfig->Validate();
  }

  std::string GetId() const { return m_id; }

  std::string GetTransformName() const { return m_type; }

  const ReportConfig &GetReportConfig() const { return *m_reportConfig; }

  std::string ToString() const {
    return "TransformConfiguration(" + m_id + ": " + m_type + ")\n" +
           m_reportConfig->ToString();
  }

  ~TransformConfiguration() = default;

private:
  std::string m_id;
  std::string m_type;
  // shared so stage copies of one configuration do not duplicate the tables
  std::shared_ptr<const ReportConfig> m_reportConfig;
};

} // namespace topline::transform
