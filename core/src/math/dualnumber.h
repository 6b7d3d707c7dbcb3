#pragma once

#include "halolensconfig.h"
#include "mathfunctions.h"
#include <cmath>

namespace halolens
{

/** Forward-mode automatic differentiation value.
 *  Holds a value together with its derivative with respect to one chosen
 *  input. Seed the input with DualNumber(x, 1) and evaluate any of the
 *  templated lensing routines with it; the derivative of the result
 *  is then available through DualNumber::getDerivative.
 */
template<class T>
class DualNumber
{
public:
	DualNumber()											{ m_value = 0; m_derivative = 0; }
	DualNumber(T value)										{ m_value = value; m_derivative = 0; }
	DualNumber(T value, T derivative)						{ m_value = value; m_derivative = derivative; }

	T getValue() const										{ return m_value; }
	T getDerivative() const									{ return m_derivative; }
private:
	T m_value;
	T m_derivative;
};

typedef DualNumber<double> DualNumberd;

template<class T>
inline DualNumber<T> operator-(const DualNumber<T> &a)
{
	return DualNumber<T>(-a.getValue(), -a.getDerivative());
}

template<class T>
inline DualNumber<T> operator+(const DualNumber<T> &a, const DualNumber<T> &b)
{
	return DualNumber<T>(a.getValue()+b.getValue(), a.getDerivative()+b.getDerivative());
}

template<class T>
inline DualNumber<T> operator-(const DualNumber<T> &a, const DualNumber<T> &b)
{
	return DualNumber<T>(a.getValue()-b.getValue(), a.getDerivative()-b.getDerivative());
}

template<class T>
inline DualNumber<T> operator*(const DualNumber<T> &a, const DualNumber<T> &b)
{
	return DualNumber<T>(a.getValue()*b.getValue(), a.getDerivative()*b.getValue() + a.getValue()*b.getDerivative());
}

template<class T>
inline DualNumber<T> operator/(const DualNumber<T> &a, const DualNumber<T> &b)
{
	T inv = (T)1/b.getValue();
	T v = a.getValue()*inv;
	return DualNumber<T>(v, (a.getDerivative() - v*b.getDerivative())*inv);
}

template<class T> inline DualNumber<T> operator+(const DualNumber<T> &a, T b)		{ return DualNumber<T>(a.getValue()+b, a.getDerivative()); }
template<class T> inline DualNumber<T> operator+(T a, const DualNumber<T> &b)		{ return DualNumber<T>(a+b.getValue(), b.getDerivative()); }
template<class T> inline DualNumber<T> operator-(const DualNumber<T> &a, T b)		{ return DualNumber<T>(a.getValue()-b, a.getDerivative()); }
template<class T> inline DualNumber<T> operator-(T a, const DualNumber<T> &b)		{ return DualNumber<T>(a-b.getValue(), -b.getDerivative()); }
template<class T> inline DualNumber<T> operator*(const DualNumber<T> &a, T b)		{ return DualNumber<T>(a.getValue()*b, a.getDerivative()*b); }
template<class T> inline DualNumber<T> operator*(T a, const DualNumber<T> &b)		{ return DualNumber<T>(a*b.getValue(), a*b.getDerivative()); }
template<class T> inline DualNumber<T> operator/(const DualNumber<T> &a, T b)		{ return DualNumber<T>(a.getValue()/b, a.getDerivative()/b); }
template<class T> inline DualNumber<T> operator/(T a, const DualNumber<T> &b)		{ return DualNumber<T>(a)/b; }

// Comparisons with a plain value only look at the value part
template<class T> inline bool operator<(const DualNumber<T> &a, T b)					{ return a.getValue() < b; }
template<class T> inline bool operator>(const DualNumber<T> &a, T b)					{ return a.getValue() > b; }

template<class T>
inline DualNumber<T> sqrt(const DualNumber<T> &a)
{
	T r = std::sqrt(a.getValue());
	T inv = (r > 0)?((T)0.5/r):(T)0;
	return DualNumber<T>(r, a.getDerivative()*inv);
}

template<class T>
inline DualNumber<T> log(const DualNumber<T> &a)
{
	return DualNumber<T>(std::log(a.getValue()), a.getDerivative()/a.getValue());
}

template<class T>
inline DualNumber<T> pow(const DualNumber<T> &a, T p)
{
	return DualNumber<T>(std::pow(a.getValue(), p), p*std::pow(a.getValue(), p-(T)1)*a.getDerivative());
}

template<class T>
inline DualNumber<T> atan(const DualNumber<T> &a)
{
	T v = a.getValue();
	return DualNumber<T>(std::atan(v), a.getDerivative()/((T)1+v*v));
}

template<class T>
inline DualNumber<T> atanh(const DualNumber<T> &a)
{
	T v = a.getValue();
	return DualNumber<T>(std::atanh(v), a.getDerivative()/((T)1-v*v));
}

template<class T>
inline DualNumber<T> acos(const DualNumber<T> &a)
{
	T v = a.getValue();
	return DualNumber<T>(std::acos(v), -a.getDerivative()/std::sqrt((T)1-v*v));
}

template<class T>
inline DualNumber<T> acosh(const DualNumber<T> &a)
{
	T v = a.getValue();
	return DualNumber<T>(std::acosh(v), a.getDerivative()/std::sqrt(v*v-(T)1));
}

} // end namespace
