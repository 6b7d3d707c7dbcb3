#pragma once

#include "halolensconfig.h"
#include <errut/booltype.h>
#include <vector>
#include <string>
#include <utility>
#include <algorithm>

namespace halolens
{

/** Dense N-dimensional array of values, stored in row-major order.
 *  A default constructed array, or one constructed from a single value, is
 *  a scalar (it has an empty shape and one element). Arrays of different
 *  shapes can be combined element-wise using the usual broadcasting rules:
 *  shapes are aligned on their trailing dimensions, and a dimension of
 *  size one is stretched to match the other one.
 */
template <class T>
class NDArray
{
public:
	NDArray()													{ m_values.resize(1, (T)0); }
	NDArray(T value)											{ m_values.resize(1, value); }
	NDArray(const std::vector<T> &values)						{ m_shape = { values.size() }; m_values = values; }
	NDArray(const std::vector<size_t> &shape, T value = T())	{ m_shape = shape; m_values.resize(getElementCount(shape), value); }
	~NDArray()													{ }

	/** Creates an array with the specified shape, the number of values must match. */
	static errut::bool_t create(const std::vector<size_t> &shape, const std::vector<T> &values, NDArray &dst);

	const std::vector<size_t> &getShape() const					{ return m_shape; }
	size_t getNumberOfDimensions() const						{ return m_shape.size(); }
	size_t getNumberOfElements() const							{ return m_values.size(); }
	bool isScalar() const										{ return m_shape.size() == 0; }

	const std::vector<T> &getValues() const						{ return m_values; }
	T operator[](size_t idx) const								{ return m_values[idx]; }
	T &operator[](size_t idx)									{ return m_values[idx]; }

	/** Returns the value that ends up at position \c flatIndex when this
	 *  array is broadcast to \c targetShape; the target shape must be a
	 *  valid broadcast of the shape of this array.
	 */
	T getBroadcastValue(size_t flatIndex, const std::vector<size_t> &targetShape) const;

	static size_t getElementCount(const std::vector<size_t> &shape);
	static std::string getShapeString(const std::vector<size_t> &shape);
private:
	std::vector<size_t> m_shape;
	std::vector<T> m_values;
};

typedef NDArray<double> NDArrayd;

template <class T>
inline errut::bool_t NDArray<T>::create(const std::vector<size_t> &shape, const std::vector<T> &values, NDArray &dst)
{
	size_t num = getElementCount(shape);
	if (num != values.size())
		return "Shape " + getShapeString(shape) + " needs " + std::to_string(num) + " values, but " +
		       std::to_string(values.size()) + " were specified";

	dst.m_shape = shape;
	dst.m_values = values;
	return true;
}

template <class T>
inline T NDArray<T>::getBroadcastValue(size_t flatIndex, const std::vector<size_t> &targetShape) const
{
	if (m_values.size() == 1)
		return m_values[0];

	const size_t numTargetDims = targetShape.size();
	const size_t numDims = m_shape.size();
	size_t offset = 0;
	size_t stride = 1;

	for (size_t k = 0 ; k < numDims ; k++)
	{
		size_t targetDim = targetShape[numTargetDims-1-k];
		size_t dim = m_shape[numDims-1-k];
		size_t i = flatIndex % targetDim;

		flatIndex /= targetDim;
		if (dim != 1)
			offset += i*stride;
		stride *= dim;
	}
	return m_values[offset];
}

template <class T>
inline size_t NDArray<T>::getElementCount(const std::vector<size_t> &shape)
{
	size_t num = 1;
	for (auto s : shape)
		num *= s;
	return num;
}

template <class T>
inline std::string NDArray<T>::getShapeString(const std::vector<size_t> &shape)
{
	std::string s = "(";
	for (size_t i = 0 ; i < shape.size() ; i++)
	{
		if (i > 0)
			s += ",";
		s += std::to_string(shape[i]);
	}
	return s + ")";
}

/** Merges \c other into \c shape according to the broadcasting rules. */
inline errut::bool_t combineBroadcastShapes(std::vector<size_t> &shape, const std::vector<size_t> &other)
{
	size_t numDims = std::max(shape.size(), other.size());
	std::vector<size_t> result(numDims);

	for (size_t k = 0 ; k < numDims ; k++)
	{
		size_t a = (k < shape.size())?shape[shape.size()-1-k]:1;
		size_t b = (k < other.size())?other[other.size()-1-k]:1;

		if (a != b && a != 1 && b != 1)
			return "Shapes " + NDArrayd::getShapeString(shape) + " and " + NDArrayd::getShapeString(other) +
			       " can't be broadcast together";

		result[numDims-1-k] = (a == 1)?b:a;
	}

	shape.swap(result);
	return true;
}

inline errut::bool_t getBroadcastShape(std::vector<size_t> &shape)
{
	return true;
}

/** Determines the shape that results from broadcasting all arrays
 *  together, starting from (and combining with) the contents of \c shape.
 */
template <class T, class... Rest>
inline errut::bool_t getBroadcastShape(std::vector<size_t> &shape, const NDArray<T> &array, const Rest &... rest)
{
	errut::bool_t r = combineBroadcastShapes(shape, array.getShape());
	if (!r)
		return r;
	return getBroadcastShape(shape, rest...);
}

/** Evaluates \c func for every element of the broadcast of the input
 *  arrays and stores the results in \c result. Elements are independent
 *  of each other, and \c result may be one of the inputs.
 */
template <class R, class F, class... Args>
inline errut::bool_t elementWise(NDArray<R> &result, F func, const NDArray<Args> &... arrays)
{
	std::vector<size_t> shape;
	errut::bool_t r = getBroadcastShape(shape, arrays...);
	if (!r)
		return r;

	NDArray<R> tmp(shape);
	const size_t num = tmp.getNumberOfElements();
	for (size_t i = 0 ; i < num ; i++)
		tmp[i] = func(arrays.getBroadcastValue(i, shape)...);

	result = std::move(tmp);
	return true;
}

} // end namespace
