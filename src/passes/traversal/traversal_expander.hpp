/*
 * traversal_expander.hpp - directory traversal prefixes
 *
 * for each depth d in the range and each token pair:
 *   (traversal + separator) * d + path
 * the OS separators inside the path are rewritten to the pair's
 * separator so "....//" pairs stay consistent through the whole payload.
 */

#ifndef LFICHEF_TRAVERSAL_EXPANDER_HPP
#define LFICHEF_TRAVERSAL_EXPANDER_HPP

#include "traversal_base.hpp"
#include "../../common/logging.hpp"

#include <optional>

namespace lfichef {
namespace traversal {

class TraversalExpander : public MutationPass {
public:
    TraversalExpander() : logger_("TraversalExpander") {}

    TraversalExpander(TargetOS os, std::optional<TraversalSpec> spec)
        : logger_("TraversalExpander") {
        configure(os, std::move(spec));
    }

    void configure(TargetOS os, std::optional<TraversalSpec> spec);

    std::string getName() const override { return "traversal"; }
    std::string getDescription() const override {
        return "Prepends directory traversal sequences at each configured depth";
    }
    PassPriority getPriority() const override { return PassPriority::Traversal; }
    bool isActive() const override { return spec_.has_value(); }

    /**
     * All traversal variants of a path, depth ascending then token order.
     * Depth 0 yields the path unchanged. Without a depth range yields nothing.
     */
    VariantList expand(const std::string& path) const;

    VariantList mutate(const std::string& payload) override;

    const std::optional<TraversalSpec>& getSpec() const { return spec_; }

    static std::string buildPrefix(const TraversalToken& token, int depth);

private:
    TargetOS os_ = TargetOS::Linux;
    std::optional<TraversalSpec> spec_;
    Logger logger_;

    std::string join(const std::string& prefix,
                     const TraversalToken& token,
                     const std::string& path) const;
};

} // namespace traversal
} // namespace lfichef

#endif // LFICHEF_TRAVERSAL_EXPANDER_HPP
