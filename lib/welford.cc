/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <trialbuf/errors.h>
#include <trialbuf/welford.h>

#include <unsupported/Eigen/SpecialFunctions>

#include <algorithm>
#include <functional>
#include <limits>
#include <numeric>

namespace gr {
namespace trialbuf {

using Eigen::Index;

namespace {

std::string shape_string(const shape_t& shape)
{
  std::string s = "[";
  for (size_t d = 0; d < shape.size(); ++ d) {
    s += (d ? "x" : "") + std::to_string(shape[d]);
  }
  return s + "]";
}

// at least two dimensions, no trailing singletons beyond the second
shape_t normalized(shape_t shape)
{
  for (Index extent : shape) {
    if (extent < 0) {
      throw validation_error("negative extent in shape " + shape_string(shape));
    }
  }
  while (shape.size() > 2 && shape.back() == 1) {
    shape.pop_back();
  }
  while (shape.size() < 2) {
    shape.push_back(1);
  }
  return shape;
}

shape_t padded(shape_t shape, size_t dims)
{
  if (shape.size() < dims) {
    shape.resize(dims, 1);
  }
  return shape;
}

Index elements(const shape_t& shape)
{
  return std::accumulate(shape.begin(), shape.end(), Index(1), std::multiplies<Index>());
}

shape_t strides(const shape_t& shape)
{
  shape_t result(shape.size());
  Index stride = 1;
  for (size_t d = 0; d < shape.size(); ++ d) {
    result[d] = stride;
    stride *= shape[d];
  }
  return result;
}

// advance a column-major multi-index, first dimension fastest
void next_index(shape_t& index, const shape_t& shape)
{
  for (size_t d = 0; d < index.size(); ++ d) {
    if (++ index[d] < shape[d]) {
      return;
    }
    index[d] = 0;
  }
}

} // namespace

dim_range::dim_range(bool all, std::vector<Index> indices)
  : d_all(all),
    d_indices(std::move(indices))
{
}

dim_range dim_range::all()
{
  return dim_range(true, {});
}

dim_range dim_range::span(Index begin, Index end)
{
  if (begin < 0 || end < begin) {
    throw range_error("invalid index span [" + std::to_string(begin) + ", " +
                      std::to_string(end) + ")");
  }
  std::vector<Index> indices(end - begin);
  std::iota(indices.begin(), indices.end(), begin);
  return dim_range(false, std::move(indices));
}

dim_range dim_range::at(Index index)
{
  return dim_range(false, { index });
}

dim_range dim_range::list(std::vector<Index> indices)
{
  return dim_range(false, std::move(indices));
}

std::vector<Index> dim_range::resolve(Index extent) const
{
  if (d_all) {
    std::vector<Index> indices(extent);
    std::iota(indices.begin(), indices.end(), Index(0));
    return indices;
  }
  for (Index i : d_indices) {
    if (i < 0 || i >= extent) {
      throw range_error("index " + std::to_string(i) + " outside dimension of extent " +
                        std::to_string(extent));
    }
  }
  return d_indices;
}

welford::welford()
  : welford(shape_t{ 1, 1 })
{
}

welford::welford(const shape_t& shape)
  : d_shape(normalized(shape)),
    d_count(array_type::Zero(elements(d_shape))),
    d_mean(array_type::Zero(d_count.size())),
    d_m2(array_type::Zero(d_count.size()))
{
}

welford::welford(const shape_t& shape,
                 const array_type& count,
                 const array_type& mean,
                 const array_type& m2)
  : d_shape(normalized(shape))
{
  Index n = elements(d_shape);
  if (count.size() != n || mean.size() != n || m2.size() != n) {
    throw validation_error("count, mean and M2 must each hold " + std::to_string(n) +
                           " elements for shape " + shape_string(d_shape));
  }
  if ((count < 0).any() || (m2 < 0).any()) {
    throw validation_error("count and M2 must be non-negative");
  }
  d_count = count;
  d_mean = mean;
  d_m2 = m2;
}

Index welford::size(size_t dim) const
{
  return dim < d_shape.size() ? d_shape[dim] : 1;
}

bool welford::is_vector() const
{
  return ndims() == 2 && (d_shape[0] == 1 || d_shape[1] == 1);
}

welford::array_type welford::variance() const
{
  array_type nan = array_type::Constant(numel(), std::numeric_limits<double>::quiet_NaN());
  return (d_count < 2).select(nan, d_m2 / (d_count - 1));
}

welford::array_type welford::stddev() const
{
  return variance().sqrt();
}

welford::array_type welford::sem() const
{
  return stddev() / d_count.sqrt();
}

welford::array_type welford::bernoulli_ci(double p) const
{
  if (!(p > 0 && p < 1)) {
    throw validation_error("confidence level must be in range (0,1), got " +
                           std::to_string(p));
  }
  double z = Eigen::numext::abs(Eigen::numext::ndtri((1 - p) / 2));
  return z * (d_mean * (1 - d_mean) / d_count).sqrt();
}

void welford::accumulate(const array_type& x)
{
  if (x.size() != numel()) {
    throw validation_error("cannot accumulate " + std::to_string(x.size()) +
                           " values into " + shape_string(d_shape));
  }

  array_type count = d_count + 1;
  array_type delta = x - d_mean;
  array_type mean = d_mean + delta / count;
  array_type m2 = d_m2 + delta * (x - mean);

  d_count.swap(count);
  d_mean.swap(mean);
  d_m2.swap(m2);
}

void welford::accumulate(const array_type& x, const shape_t& shape)
{
  shape_t given = normalized(shape);
  if (given != d_shape || x.size() != elements(given)) {
    throw validation_error("cannot accumulate " + std::to_string(x.size()) +
                           " values shaped " + shape_string(given) + " into " +
                           shape_string(d_shape));
  }
  accumulate(x);
}

void welford::accumulate(double x)
{
  accumulate(array_type::Constant(1, x));
}

std::vector<Index> welford::select(const std::vector<dim_range>& ranges,
                                   shape_t& selected) const
{
  size_t dims = std::max(ndims(), ranges.size());
  shape_t shape = padded(d_shape, dims);
  shape_t stride = strides(shape);

  std::vector<std::vector<Index>> chosen(dims);
  selected.assign(dims, 0);
  for (size_t d = 0; d < dims; ++ d) {
    chosen[d] = d < ranges.size() ? ranges[d].resolve(shape[d])
                                  : dim_range::all().resolve(shape[d]);
    selected[d] = chosen[d].size();
  }

  std::vector<Index> source(elements(selected));
  shape_t index(dims, 0);
  for (Index& s : source) {
    s = 0;
    for (size_t d = 0; d < dims; ++ d) {
      s += chosen[d][index[d]] * stride[d];
    }
    next_index(index, selected);
  }
  selected = normalized(selected);
  return source;
}

welford welford::gather(const shape_t& shape, const std::vector<Index>& source) const
{
  welford out(shape);
  for (size_t i = 0; i < source.size(); ++ i) {
    out.d_count(i) = d_count(source[i]);
    out.d_mean(i) = d_mean(source[i]);
    out.d_m2(i) = d_m2(source[i]);
  }
  return out;
}

welford welford::get_range(const std::vector<dim_range>& ranges) const
{
  shape_t selected;
  std::vector<Index> source = select(ranges, selected);
  return gather(selected, source);
}

void welford::set_range(const std::vector<dim_range>& ranges, const welford& values)
{
  shape_t selected;
  std::vector<Index> target = select(ranges, selected);
  if (values.shape() != selected) {
    throw validation_error("cannot assign " + shape_string(values.shape()) +
                           " to a selection of " + shape_string(selected));
  }

  for (size_t i = 0; i < target.size(); ++ i) {
    d_count(target[i]) = values.d_count(i);
    d_mean(target[i]) = values.d_mean(i);
    d_m2(target[i]) = values.d_m2(i);
  }
}

void welford::accumulate_range(const std::vector<dim_range>& ranges, const array_type& x)
{
  welford part = get_range(ranges);
  part.accumulate(x);
  set_range(ranges, part);
}

welford welford::reshape(const shape_t& shape) const
{
  shape_t target = normalized(shape);
  if (elements(target) != numel()) {
    throw validation_error("cannot reshape " + shape_string(d_shape) + " to " +
                           shape_string(target));
  }
  welford out(*this);
  out.d_shape = target;
  return out;
}

welford welford::permute(const std::vector<size_t>& order) const
{
  std::vector<size_t> sorted(order);
  std::sort(sorted.begin(), sorted.end());
  bool valid = order.size() >= ndims();
  for (size_t d = 0; valid && d < sorted.size(); ++ d) {
    valid = sorted[d] == d;
  }
  if (!valid) {
    throw validation_error("permute order must rearrange all " + std::to_string(ndims()) +
                           " dimensions");
  }

  shape_t shape = padded(d_shape, order.size());
  shape_t stride = strides(shape);
  shape_t permuted(order.size());
  for (size_t d = 0; d < order.size(); ++ d) {
    permuted[d] = shape[order[d]];
  }

  std::vector<Index> source(numel());
  shape_t index(order.size(), 0);
  for (Index& s : source) {
    s = 0;
    for (size_t d = 0; d < order.size(); ++ d) {
      s += index[d] * stride[order[d]];
    }
    next_index(index, permuted);
  }
  return gather(permuted, source);
}

welford welford::replicate(const shape_t& reps) const
{
  for (Index r : reps) {
    if (r < 0) {
      throw validation_error("negative repeat count in " + shape_string(reps));
    }
  }
  size_t dims = std::max(ndims(), reps.size());
  shape_t shape = padded(d_shape, dims);
  shape_t times = padded(reps, dims);
  shape_t stride = strides(shape);

  shape_t tiled(dims);
  for (size_t d = 0; d < dims; ++ d) {
    tiled[d] = shape[d] * times[d];
  }

  std::vector<Index> source(elements(tiled));
  shape_t index(dims, 0);
  for (Index& s : source) {
    s = 0;
    for (size_t d = 0; d < dims; ++ d) {
      s += (index[d] % shape[d]) * stride[d];
    }
    next_index(index, tiled);
  }
  return gather(tiled, source);
}

welford welford::concat(size_t axis, const std::vector<welford>& parts)
{
  if (parts.empty()) {
    throw validation_error("nothing to concatenate");
  }

  size_t dims = axis + 1;
  for (const welford& part : parts) {
    dims = std::max(dims, part.ndims());
  }

  shape_t joined = padded(parts.front().shape(), dims);
  joined[axis] = 0;
  for (const welford& part : parts) {
    shape_t shape = padded(part.shape(), dims);
    for (size_t d = 0; d < dims; ++ d) {
      if (d != axis && shape[d] != joined[d]) {
        throw validation_error("cannot concatenate " + shape_string(part.shape()) +
                               " along dimension " + std::to_string(axis) +
                               " with " + shape_string(parts.front().shape()));
      }
    }
    joined[axis] += shape[axis];
  }

  welford out(joined);
  shape_t stride = strides(padded(out.shape(), dims));
  Index offset = 0;
  for (const welford& part : parts) {
    shape_t shape = padded(part.shape(), dims);
    shape_t index(dims, 0);
    for (Index i = 0; i < part.numel(); ++ i) {
      Index target = offset * stride[axis];
      for (size_t d = 0; d < dims; ++ d) {
        target += index[d] * stride[d];
      }
      out.d_count(target) = part.d_count(i);
      out.d_mean(target) = part.d_mean(i);
      out.d_m2(target) = part.d_m2(i);
      next_index(index, shape);
    }
    offset += shape[axis];
  }
  return out;
}

} // namespace trialbuf
} // namespace gr
