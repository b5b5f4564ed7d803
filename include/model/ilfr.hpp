/***
 * The Independent LFR model.
 */
#ifndef MLL_ILFR_HPP
#define MLL_ILFR_HPP

#include "model/quality_model.hpp"

/// Distance kept between mu and the ends of (0, 1).
static const double ILFR_EPSILON = 1e-7;

/// Like ILFRs, but external edges may also land inside a community, so that the rate of an intra-community edge is
/// (1 - mu) / D_c + mu / 2E. The log-likelihood,
///     Eout log(mu) - Eout log(2E) + sum_c in_c log((1 - mu) / D_c + mu / 2E) - E + sum_v d_v log(d_v),
/// is also the objective of the local search. mu has no closed-form estimate.
class ILFR : public IQualityModel {
public:
    double remove_gain(const CommunityAggregates &aggregates, long vertex, double weight_to_community,
                       const ModelContext &context, double parameter) const override;
    double insert_gain(const CommunityAggregates &aggregates, long vertex, long community, double weight_to_community,
                       const ModelContext &context, double parameter) const override;
    double quality(const PartitionStatistics &statistics, double parameter) const override;
    double log_likelihood(const PartitionStatistics &statistics, double parameter) const override;
    /// Maximizes the log-likelihood over mu with `minimizer`. Throws an OptimizationError carrying Eout / E if the
    /// minimizer returns a non-finite value, or a value worse than Eout / E.
    double estimate_parameter(const PartitionStatistics &statistics, const IMinimizer &minimizer) const override;
    ModelType type() const override { return ModelType::ILFR; }
    std::string parameter_name() const override { return "mu"; }
    std::string domain() const override { return "(0, 1)"; }
    double default_parameter() const override { return 0.5; }
    bool is_valid(double parameter) const override;
    double clamp(double parameter) const override;
};

#endif // MLL_ILFR_HPP
