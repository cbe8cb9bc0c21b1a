/*
 * encoding_transformer.hpp
 *
 * applies every non-empty subset of the selected techniques to a path.
 * k techniques -> 2^k - 1 variants. inside a subset the techniques run in
 * option order, and each one after the first also re-encodes the '%'
 * left behind by the ones before it.
 *
 * with alternate_forms set, each chain is also expanded over the forms of
 * its techniques (b has 2, o has 3), so one subset can yield several
 * variants. the 2^k - 1 count only holds with alternate_forms off.
 */

#ifndef LFICHEF_ENCODING_TRANSFORMER_HPP
#define LFICHEF_ENCODING_TRANSFORMER_HPP

#include "encoding_base.hpp"
#include "../../common/logging.hpp"

namespace lfichef {
namespace encoding {

struct EncodingConfig {
    EncodingSet set;
    TargetOS os = TargetOS::Linux;
    EncodeScope scope = EncodeScope::Special;
    bool alternate_forms = false;
};

class EncodingTransformer : public MutationPass {
public:
    EncodingTransformer() : logger_("EncodingTransformer") {}

    explicit EncodingTransformer(const EncodingConfig& config)
        : logger_("EncodingTransformer") {
        configure(config);
    }

    void configure(const EncodingConfig& config);

    const EncodingConfig& getConfig() const { return config_; }

    std::string getName() const override { return "encoding"; }
    std::string getDescription() const override {
        return "Applies URL, double URL, 16-bit unicode and overlong UTF-8 encodings";
    }
    PassPriority getPriority() const override { return PassPriority::Encoding; }
    bool isActive() const override { return !config_.set.empty(); }

    /**
     * One variant per non-empty technique subset, ordered by subset size
     * then option order. An empty set yields the path itself.
     * With alternate forms, each subset emits one variant per form
     * combination, last technique's form varying fastest.
     */
    VariantList transform(const std::string& path) const;

    VariantList mutate(const std::string& payload) override;

    /**
     * The technique chains transform() walks, in emission order
     */
    const std::vector<std::vector<Encoding>>& getChains() const { return chains_; }

    /**
     * Number of variants transform() emits per path
     */
    size_t variantCount() const;

    /**
     * Forms used for a technique under the current config
     */
    int formsFor(Encoding technique) const {
        return config_.alternate_forms ? encodingFormCount(technique) : 1;
    }

    static std::string encodeChar(Encoding technique, unsigned char c, int form = 0);

    /**
     * Run one technique over a string
     *
     * @param include_percent also rewrite '%' (set for chained techniques)
     * @param form rendering to use, see encodingFormCount()
     */
    std::string applyTechnique(Encoding technique, const std::string& input,
                               bool include_percent, int form = 0) const;

private:
    EncodingConfig config_;
    std::vector<std::vector<Encoding>> chains_;
    Logger logger_;

    bool shouldEncode(unsigned char c, bool include_percent) const;
    void buildChains();
};

} // namespace encoding
} // namespace lfichef

#endif // LFICHEF_ENCODING_TRANSFORMER_HPP
