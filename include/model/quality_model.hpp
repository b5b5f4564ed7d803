/***
 * The statistical models under which a partition is scored. Every model exposes the change in its objective caused
 * by moving a single vertex, so that the same local search can optimize any of them.
 */
#ifndef MLL_QUALITY_MODEL_HPP
#define MLL_QUALITY_MODEL_HPP

#include <memory>
#include <string>

#include "aggregates.hpp"
#include "minimizer.hpp"
#include "statistics.hpp"

enum class ModelType { PPM, DCPPM, ILFR, ILFRs };

/// A named scalar model parameter: "gamma" for PPM and DCPPM, "mu" for ILFR and ILFRs.
typedef struct parameter_t {
    std::string name;
    double value;
} Parameter;

class IQualityModel {
public:
    virtual ~IQualityModel() = default;
    /// Returns the change in the objective caused by moving `vertex` from its current community into `community`.
    /// Returns exactly 0 if `community` is the current community of `vertex`.
    double move_gain(const CommunityAggregates &aggregates, long vertex, long community, const ModelContext &context,
                     double parameter) const;
    /// Returns the change in the objective caused by moving `vertex` out of its current community and into a
    /// community of its own. `weight_to_community` is the weight of the edges between `vertex` and the other members
    /// of its community.
    virtual double remove_gain(const CommunityAggregates &aggregates, long vertex, double weight_to_community,
                               const ModelContext &context, double parameter) const = 0;
    /// Returns the change in the objective caused by merging `vertex`, once isolated, into `community`.
    /// `vertex` must not be a member of `community`.
    virtual double insert_gain(const CommunityAggregates &aggregates, long vertex, long community,
                               double weight_to_community, const ModelContext &context, double parameter) const = 0;
    /// The objective maximized by the local search when the parameter is held fixed.
    virtual double quality(const PartitionStatistics &statistics, double parameter) const = 0;
    /// The log-likelihood of the graph given the partition.
    virtual double log_likelihood(const PartitionStatistics &statistics, double parameter) const = 0;
    /// Returns the parameter that maximizes the likelihood of the partition. Unclamped.
    virtual double estimate_parameter(const PartitionStatistics &statistics, const IMinimizer &minimizer) const = 0;
    virtual ModelType type() const = 0;
    virtual std::string parameter_name() const = 0;
    /// Describes the domain of the parameter, e.g. "(0, 1)".
    virtual std::string domain() const = 0;
    virtual double default_parameter() const = 0;
    /// Returns true if `parameter` lies inside the domain of the model's parameter.
    virtual bool is_valid(double parameter) const = 0;
    /// Clamps `parameter` into the representable part of its domain.
    virtual double clamp(double parameter) const = 0;
};

namespace model {

/// Builds the model of the given type.
std::unique_ptr<IQualityModel> make(ModelType type);

/// Returns the lower-case name of the model.
std::string name(ModelType type);

/// Parses a (case-insensitive) model name. Throws a ConfigurationError if the name is unknown.
ModelType parse(const std::string &name);

}  // namespace model

#endif // MLL_QUALITY_MODEL_HPP
