/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef INCLUDED_TRIALBUF_WELFORD_H
#define INCLUDED_TRIALBUF_WELFORD_H

#include <trialbuf/api.h>

#include <Eigen/Core>

#include <vector>

namespace gr {
namespace trialbuf {

using shape_t = std::vector<Eigen::Index>;

/*!
 * \brief Selection along one dimension of a welford accumulator.
 */
class TRIALBUF_API dim_range
{
public:
  //! every index of the dimension
  static dim_range all();
  //! indices [begin, end)
  static dim_range span(Eigen::Index begin, Eigen::Index end);
  static dim_range at(Eigen::Index index);
  //! arbitrary indices, in the given order
  static dim_range list(std::vector<Eigen::Index> indices);

  //! throws range_error for an index outside [0, extent)
  std::vector<Eigen::Index> resolve(Eigen::Index extent) const;

private:
  dim_range(bool all, std::vector<Eigen::Index> indices);

  bool d_all;
  std::vector<Eigen::Index> d_indices;
};

/*!
 * \brief Running mean and variance of every element of an N-d array.
 *
 * Elements are stored column-major, first index fastest.  Each holds a
 * count, a mean and a sum of squared deviations M2, updated with Welford's
 * method.  count, mean and M2 always share one shape.  Dimensions beyond
 * ndims() are singleton.
 *
 * Every operation checks its arguments before touching any element; a
 * throwing call leaves the accumulator as it was.
 */
class TRIALBUF_API welford
{
public:
  using array_type = Eigen::ArrayXd;

  //! a single element
  welford();
  //! zero counts, means and M2 of the given shape
  explicit welford(const shape_t& shape);
  //! resume from previous statistics, which must all have \p shape's size
  welford(const shape_t& shape,
          const array_type& count,
          const array_type& mean,
          const array_type& m2);

  const shape_t& shape() const { return d_shape; }
  size_t ndims() const { return d_shape.size(); }
  Eigen::Index size(size_t dim) const;
  Eigen::Index numel() const { return d_count.size(); }
  bool empty() const { return numel() == 0; }
  bool is_scalar() const { return numel() == 1; }
  bool is_vector() const;
  bool is_matrix() const { return ndims() == 2; }

  const array_type& count() const { return d_count; }
  const array_type& mean() const { return d_mean; }
  const array_type& m2() const { return d_m2; }

  //! sample variance; NaN where count < 2
  array_type variance() const;
  array_type stddev() const;
  //! standard error of the mean
  array_type sem() const;
  /*!
   * \brief Half-width of the normal-approximation confidence interval of
   * a proportion, for accumulators fed only with 0 and 1.
   *
   * \p p is the confidence level, in (0, 1).
   */
  array_type bernoulli_ci(double p = 0.95) const;

  //! add one observation per element; \p x holds numel() values
  void accumulate(const array_type& x);
  //! as above, with \p x laid out in \p shape, which must match shape()
  void accumulate(const array_type& x, const shape_t& shape);
  void accumulate(double x);

  /*!
   * \brief Add one observation to each selected element.
   *
   * \p x holds one value per selected element, column-major over the
   * selection.  Unselected elements are unchanged.
   */
  void accumulate_range(const std::vector<dim_range>& ranges, const array_type& x);

  welford get_range(const std::vector<dim_range>& ranges) const;
  //! overwrite the selected elements with \p values, shaped like the selection
  void set_range(const std::vector<dim_range>& ranges, const welford& values);

  welford reshape(const shape_t& shape) const;
  //! \p order lists source dimensions, covering at least ndims()
  welford permute(const std::vector<size_t>& order) const;
  //! tile \p reps[d] copies along each dimension d
  welford replicate(const shape_t& reps) const;

  static welford concat(size_t axis, const std::vector<welford>& parts);
  static welford hconcat(const std::vector<welford>& parts) { return concat(1, parts); }
  static welford vconcat(const std::vector<welford>& parts) { return concat(0, parts); }

private:
  shape_t d_shape;
  array_type d_count;
  array_type d_mean;
  array_type d_m2;

  std::vector<Eigen::Index> select(const std::vector<dim_range>& ranges,
                                   shape_t& selected) const;
  welford gather(const shape_t& shape, const std::vector<Eigen::Index>& source) const;
};

} // namespace trialbuf
} // namespace gr

#endif /* INCLUDED_TRIALBUF_WELFORD_H */
