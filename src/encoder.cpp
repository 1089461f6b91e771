#include <f1ml/encoder.hpp>
#include <memory>
#include <stdexcept>
#include <openssl/evp.h>

namespace f1ml {

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* c) const { EVP_MD_CTX_free(c); }
};

std::array<unsigned char, 16> md5_digest(const std::string& value) {
  std::array<unsigned char, 16> out{};
  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  unsigned int len = 0;
  if (!ctx ||
      EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), value.data(), value.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 ||
      len != out.size()) {
    throw std::runtime_error("MD5 digest failed");
  }
  return out;
}

template <std::size_t N>
void one_hot(FeatureRow& row, const std::string& prefix,
             const std::array<const char*, N>& vocab, const std::string& label) {
  for (const char* v : vocab) row[prefix + "_" + v] = (label == v) ? 1.0 : 0.0;
}

} // namespace

std::size_t encode_category(const std::string& value, std::size_t modulus) {
  if (modulus == 0 || modulus > (1ULL << 48)) {
    throw std::invalid_argument("encoding modulus must be in [1, 2^48]");
  }
  const auto d = md5_digest(value);
  // Horner's rule over the big-endian digest keeps the remainder exact.
  unsigned long long r = 0;
  for (unsigned char b : d) r = (r * 256ULL + b) % modulus;
  return static_cast<std::size_t>(r);
}

const char* experience_level(double races_so_far) {
  if (races_so_far <= 10.0) return kExperienceLevels[0];
  if (races_so_far <= 50.0) return kExperienceLevels[1];
  return kExperienceLevels[2];
}

const char* rain_category(double max_rainfall) {
  if (max_rainfall <= 0.1) return kRainCategories[0];
  if (max_rainfall <= 1.0) return kRainCategories[1];
  return kRainCategories[2];
}

const char* qualifying_gap_category(double gap_s) {
  if (gap_s <= 0.5) return kQualifyingGapCategories[0];
  if (gap_s <= 2.0) return kQualifyingGapCategories[1];
  return kQualifyingGapCategories[2];
}

void add_encoded_features(const PreRaceAttributes& a, FeatureRow& row, std::size_t modulus) {
  row["circuit_name_encoded"] = static_cast<double>(encode_category(a.circuit_name, modulus));
  row["country_encoded"] = static_cast<double>(encode_category(a.country, modulus));
  row["event_name_encoded"] = static_cast<double>(encode_category(a.event_name, modulus));
  row["driver_code_encoded"] = static_cast<double>(encode_category(a.driver_code, modulus));
  row["constructor_encoded"] = static_cast<double>(encode_category(a.constructor, modulus));
}

void add_bucket_features(FeatureRow& row) {
  one_hot(row, "experience_level", kExperienceLevels,
          experience_level(row_value(row, "races_so_far", 0.0)));
  one_hot(row, "rain_category", kRainCategories,
          rain_category(row_value(row, "max_rainfall", 0.0)));
  one_hot(row, "qualifying_gap_category", kQualifyingGapCategories,
          qualifying_gap_category(row_value(row, "qualifying_time_from_pole", kUnknownQualifyingGap)));
}

} // namespace f1ml
