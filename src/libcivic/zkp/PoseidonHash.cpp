#include "PoseidonHash.h"
#include "ZkErrors.h"
#include <map>
#include <mutex>

namespace civic {
namespace zkp {

namespace detail {

namespace {

std::vector<std::vector<Absorption>> buildSchedule(std::size_t arity) {
    std::vector<std::vector<Absorption>> schedule;
    std::size_t i = 0;
    for (; i + PoseidonParams::rate <= arity; i += PoseidonParams::rate) {
        std::vector<Absorption> chunk;
        for (std::size_t k = 0; k < PoseidonParams::rate; ++k) {
            chunk.push_back({1 + k, i + k, false});
        }
        schedule.push_back(chunk);
    }

    // Trailing chunk: remaining inputs, then a 1 in the next lane.
    // An input that fills the rate exactly still gets a padding-only block.
    std::vector<Absorption> last;
    const std::size_t remaining = arity - i;
    for (std::size_t k = 0; k < remaining; ++k) {
        last.push_back({1 + k, i + k, false});
    }
    last.push_back({1 + remaining, 0, true});
    schedule.push_back(last);
    return schedule;
}

} // namespace

const std::vector<std::vector<Absorption>>& absorptionSchedule(std::size_t arity) {
    static std::mutex mutex;
    static std::map<std::size_t, std::vector<std::vector<Absorption>>> cache;

    if (arity == 0) {
        throw MalformedInputError("Poseidon sponge needs at least one input");
    }

    std::lock_guard<std::mutex> lock(mutex);
    auto it = cache.find(arity);
    if (it == cache.end()) {
        it = cache.emplace(arity, buildSchedule(arity)).first;
    }
    return it->second;
}

const FieldT& spongeCapacity() {
    initCurveParameters();
    static const FieldT capacity = FieldT(2) ^ 64ul;
    return capacity;
}

} // namespace detail

namespace {

inline FieldT sbox(const FieldT& x) {
    const FieldT x2 = x.squared();
    const FieldT x4 = x2.squared();
    return x4 * x;
}

template <std::size_t N>
FieldT sponge(const std::array<FieldT, N>& inputs) {
    static const auto& schedule = detail::absorptionSchedule(N);

    PoseidonState state{detail::spongeCapacity(), FieldT::zero(), FieldT::zero()};
    for (const auto& chunk : schedule) {
        for (const auto& step : chunk) {
            state[step.lane] += step.padding ? FieldT::one() : inputs[step.input];
        }
        poseidonPermute(state);
    }
    return state[1];
}

} // namespace

void poseidonPermute(PoseidonState& state) {
    const PoseidonParams& params = poseidonParams();

    for (std::size_t r = 0; r < PoseidonParams::totalRounds; ++r) {
        for (std::size_t i = 0; i < PoseidonParams::width; ++i) {
            state[i] += params.roundConstants[r][i];
        }

        if (PoseidonParams::isFullRound(r)) {
            for (auto& lane : state) {
                lane = sbox(lane);
            }
        } else {
            state[0] = sbox(state[0]);
        }

        PoseidonState mixed;
        for (std::size_t i = 0; i < PoseidonParams::width; ++i) {
            FieldT acc = FieldT::zero();
            for (std::size_t j = 0; j < PoseidonParams::width; ++j) {
                acc += params.mds[i][j] * state[j];
            }
            mixed[i] = acc;
        }
        state = mixed;
    }
}

FieldT hashSingle(const FieldT& a) {
    return sponge<1>({a});
}

FieldT hashPair(const FieldT& left, const FieldT& right) {
    return sponge<2>({left, right});
}

FieldT hashTriple(const FieldT& a, const FieldT& b, const FieldT& c) {
    return sponge<3>({a, b, c});
}

std::vector<FieldT> hashPairsBatch(
    const std::vector<FieldT>& lefts,
    const std::vector<FieldT>& rights)
{
    if (lefts.size() != rights.size()) {
        throw MalformedInputError(
            "Batch hash input length mismatch: " + std::to_string(lefts.size()) +
            " vs " + std::to_string(rights.size()));
    }

    // Build shared tables before fanning out.
    poseidonParams();
    detail::absorptionSchedule(2);
    detail::spongeCapacity();

    std::vector<FieldT> out(lefts.size());
#ifdef MULTICORE
#pragma omp parallel for
#endif
    for (long i = 0; i < static_cast<long>(lefts.size()); ++i) {
        out[i] = hashPair(lefts[i], rights[i]);
    }
    return out;
}

std::vector<FieldT> hashPairsBatch(
    const std::vector<std::pair<FieldT, FieldT>>& pairs)
{
    std::vector<FieldT> lefts;
    std::vector<FieldT> rights;
    lefts.reserve(pairs.size());
    rights.reserve(pairs.size());
    for (const auto& [left, right] : pairs) {
        lefts.push_back(left);
        rights.push_back(right);
    }
    return hashPairsBatch(lefts, rights);
}

std::vector<FieldT> hashSinglesBatch(const std::vector<FieldT>& inputs) {
    poseidonParams();
    detail::absorptionSchedule(1);
    detail::spongeCapacity();

    std::vector<FieldT> out(inputs.size());
#ifdef MULTICORE
#pragma omp parallel for
#endif
    for (long i = 0; i < static_cast<long>(inputs.size()); ++i) {
        out[i] = hashSingle(inputs[i]);
    }
    return out;
}

} // namespace zkp
} // namespace civic
