#include "keyward/models/rsa_key_material.hpp"

namespace keyward::models {

namespace {
    template<typename T>
    Result<T, KeywardFailure> Fail(Result<BigNum, KeywardFailure>&& failed) {
        return std::move(failed).PropagateErr<T>();
    }
}

Result<RsaPublicKey, KeywardFailure> RsaPublicKey::Clone() const {
    auto n = modulus.Clone();
    if (n.IsErr()) {
        return Fail<RsaPublicKey>(std::move(n));
    }
    auto e = public_exponent.Clone();
    if (e.IsErr()) {
        return Fail<RsaPublicKey>(std::move(e));
    }
    return Result<RsaPublicKey, KeywardFailure>::Ok(
        RsaPublicKey{std::move(n).Unwrap(), std::move(e).Unwrap()});
}

Result<Unit, KeywardFailure> RsaPrivateKey::WithCrtParameters() {
    if (!exponent1.has_value()) {
        auto p_minus_one = prime1.SubWord(1);
        if (p_minus_one.IsErr()) {
            return Fail<Unit>(std::move(p_minus_one));
        }
        auto dp = private_exponent.Mod(p_minus_one.Unwrap());
        if (dp.IsErr()) {
            return Fail<Unit>(std::move(dp));
        }
        exponent1 = std::move(dp).Unwrap();
    }
    if (!exponent2.has_value()) {
        auto q_minus_one = prime2.SubWord(1);
        if (q_minus_one.IsErr()) {
            return Fail<Unit>(std::move(q_minus_one));
        }
        auto dq = private_exponent.Mod(q_minus_one.Unwrap());
        if (dq.IsErr()) {
            return Fail<Unit>(std::move(dq));
        }
        exponent2 = std::move(dq).Unwrap();
    }
    if (!coefficient.has_value()) {
        auto q_inv = prime2.ModInverse(prime1);
        if (q_inv.IsErr()) {
            return Fail<Unit>(std::move(q_inv));
        }
        coefficient = std::move(q_inv).Unwrap();
    }
    return Result<Unit, KeywardFailure>::Ok(unit);
}

Result<RsaPublicKey, KeywardFailure> RsaPrivateKey::PublicKey() const {
    auto n = modulus.Clone();
    if (n.IsErr()) {
        return Fail<RsaPublicKey>(std::move(n));
    }
    auto e = public_exponent.Clone();
    if (e.IsErr()) {
        return Fail<RsaPublicKey>(std::move(e));
    }
    return Result<RsaPublicKey, KeywardFailure>::Ok(
        RsaPublicKey{std::move(n).Unwrap(), std::move(e).Unwrap()});
}

Result<RsaPrivateKey, KeywardFailure> RsaPrivateKey::Clone() const {
    const BigNum* required[] = {&modulus, &public_exponent, &private_exponent, &prime1, &prime2};
    std::vector<BigNum> copies;
    copies.reserve(5);
    for (const BigNum* component : required) {
        auto copy = component->Clone();
        if (copy.IsErr()) {
            return Fail<RsaPrivateKey>(std::move(copy));
        }
        copies.push_back(std::move(copy).Unwrap());
    }
    RsaPrivateKey clone{
        std::move(copies[0]), std::move(copies[1]), std::move(copies[2]),
        std::move(copies[3]), std::move(copies[4]),
        std::nullopt, std::nullopt, std::nullopt};

    const std::optional<BigNum>* optional_src[] = {&exponent1, &exponent2, &coefficient};
    std::optional<BigNum>* optional_dst[] = {&clone.exponent1, &clone.exponent2, &clone.coefficient};
    for (size_t i = 0; i < 3; ++i) {
        if (!optional_src[i]->has_value()) {
            continue;
        }
        auto copy = (*optional_src[i])->Clone();
        if (copy.IsErr()) {
            return Fail<RsaPrivateKey>(std::move(copy));
        }
        *optional_dst[i] = std::move(copy).Unwrap();
    }
    return Result<RsaPrivateKey, KeywardFailure>::Ok(std::move(clone));
}

} // namespace keyward::models
