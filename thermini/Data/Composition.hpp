#ifndef THERMINI_DATA_COMPOSITION_HPP_
#define THERMINI_DATA_COMPOSITION_HPP_

#include <Eigen/Dense>

#include <algorithm>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace thermini {

// Species keys with a parallel array of volume fractions
template<typename Scalar>
class Composition {
public:
  using Index = Eigen::Index;
  using Array = Eigen::Array<Scalar, Eigen::Dynamic, 1>;

  Composition() = default;

  Composition(std::initializer_list<std::pair<std::string, Scalar>> entries);

  Index Size() const { return static_cast<Index>(species_.size()); }

  bool Empty() const { return species_.empty(); }

  const std::vector<std::string>& Species() const { return species_; }

  const Array& Fractions() const { return fractions_; }

  Array& Fractions() { return fractions_; }

  std::optional<Index> Find(const std::string& species) const;

  bool Contains(const std::string& species) const { return Find(species).has_value(); }

  Scalar Get(const std::string& species) const;

  void Set(const std::string& species, Scalar fraction);

  Index Ensure(const std::string& species);

  Scalar Sum() const { return fractions_.size() > 0 ? fractions_.sum() : Scalar(0.0); }

  // Copy extended with every species of other (zero fraction where new)
  Composition AlignedWith(const Composition& other) const;

  // Values of other laid out in this composition's species order
  Array ValuesOf(const Composition& other) const;

private:
  std::vector<std::string> species_;
  Array fractions_;
};

template<typename Scalar>
Composition<Scalar>::Composition(std::initializer_list<std::pair<std::string, Scalar>> entries) {
  for (const auto& [species, fraction] : entries)
    Set(species, fraction);
}

template<typename Scalar>
auto Composition<Scalar>::Find(const std::string& species) const -> std::optional<Index> {
  const auto it = std::find(species_.begin(), species_.end(), species);
  if (it == species_.end())
    return std::nullopt;
  return static_cast<Index>(std::distance(species_.begin(), it));
}

template<typename Scalar>
auto Composition<Scalar>::Get(const std::string& species) const -> Scalar {
  const auto idx = Find(species);
  return idx ? fractions_(*idx) : Scalar(0.0);
}

template<typename Scalar>
void Composition<Scalar>::Set(const std::string& species, const Scalar fraction) {
  fractions_(Ensure(species)) = fraction;
}

template<typename Scalar>
auto Composition<Scalar>::Ensure(const std::string& species) -> Index {
  if (const auto idx = Find(species))
    return *idx;

  const Index n = Size();
  species_.push_back(species);
  fractions_.conservativeResize(n + 1);
  fractions_(n) = Scalar(0.0);
  return n;
}

template<typename Scalar>
auto Composition<Scalar>::AlignedWith(const Composition& other) const -> Composition {
  Composition aligned = *this;
  for (const auto& species : other.species_)
    aligned.Ensure(species);
  return aligned;
}

template<typename Scalar>
auto Composition<Scalar>::ValuesOf(const Composition& other) const -> Array {
  Array values(Size());
  for (Index i = 0; i < Size(); ++i)
    values(i) = other.Get(species_[i]);
  return values;
}

} // namespace thermini

#endif  // THERMINI_DATA_COMPOSITION_HPP_
