#include "nfwlens.h"
#include "dualnumber.h"
#include "log.h"
#include <iostream>
#include <functional>
#include <cmath>

using namespace halolens;
using namespace std;
using namespace errut;

int errCount = 0;

void checkClose(double value, double expected, double tol, const string &desc)
{
    if (!std::isfinite(value) || std::abs(value - expected) > tol)
    {
        cout << "ERROR: expected " << expected << " for " << desc << " but found " << value
             << " (difference is " << (value-expected) << ")" << endl;
        errCount++;
    }
    else
        cout << "OK: found " << value << " for " << desc << endl;
}

struct Kernel
{
    string name;
    function<double(double)> f;
    function<DualNumberd(DualNumberd)> df;
    function<bool_t(const NDArrayd &, NDArrayd &)> batch;
    double valueAtOne;
    double derivativeAtOne;
};

vector<Kernel> getKernels()
{
    const double l = std::log(0.5);
    return {
        { "f", [](double r) { return NFWLens::F(r); }, [](DualNumberd r) { return NFWLens::F(r); },
          [](const NDArrayd &r, NDArrayd &res) { return NFWLens::F(r, res); }, 0.0, 2.0/3.0 },
        { "g", [](double r) { return NFWLens::G(r); }, [](DualNumberd r) { return NFWLens::G(r); },
          [](const NDArrayd &r, NDArrayd &res) { return NFWLens::G(r, res); }, l*l, 2.0*l + 2.0 },
        { "h", [](double r) { return NFWLens::H(r); }, [](DualNumberd r) { return NFWLens::H(r); },
          [](const NDArrayd &r, NDArrayd &res) { return NFWLens::H(r, res); }, 1.0 + l, 1.0/3.0 },
        { "k", [](double r) { return NFWLens::K(r); }, [](DualNumberd r) { return NFWLens::K(r); },
          [](const NDArrayd &r, NDArrayd &res) { return NFWLens::K(r, res); }, 1.0/3.0, -0.4 },
    };
}

void testBoundaryBatch(const Kernel &k)
{
    NDArrayd r(vector<double>{ 0.5, 1.0, 2.0 }), result;
    bool_t status = k.batch(r, result);
    if (!status)
    {
        cout << "ERROR: batched evaluation of " << k.name << " failed: " << status.getErrorString() << endl;
        errCount++;
        return;
    }

    if (result.getShape() != r.getShape())
    {
        cout << "ERROR: batched evaluation of " << k.name << " has shape " << NDArrayd::getShapeString(result.getShape()) << endl;
        errCount++;
        return;
    }

    checkClose(result[0], k.f(0.5), 0, k.name + "(0.5) in batch");
    checkClose(result[2], k.f(2.0), 0, k.name + "(2) in batch");
    if (result[1] != k.valueAtOne)
    {
        cout << "ERROR: " << k.name << "(1) is " << result[1] << " instead of " << k.valueAtOne << endl;
        errCount++;
    }
    else
        cout << "OK: " << k.name << "(1) = " << result[1] << endl;
}

void testContinuity(const Kernel &k)
{
    for (double eps : { 1e-2, 1e-3, 1e-4 })
    {
        // First order behaviour around r = 1, up to a second order term
        double tol = eps*eps + 1e-8;
        checkClose(k.f(1.0 + eps), k.valueAtOne + k.derivativeAtOne*eps, tol, k.name + " just above 1");
        checkClose(k.f(1.0 - eps), k.valueAtOne - k.derivativeAtOne*eps, tol, k.name + " just below 1");
    }
}

void testDerivatives(const Kernel &k)
{
    DualNumberd one = k.df(DualNumberd(1.0, 1.0));
    checkClose(one.getValue(), k.valueAtOne, 0, k.name + " value at 1 as dual number");
    checkClose(one.getDerivative(), k.derivativeAtOne, 1e-12, k.name + "' at 1");

    // Compare to central differences, also across the r = 1 boundary
    const double h = 1e-4;
    for (double r : { 0.1, 0.5, 0.99, 1.0, 1.01, 2.0, 10.0 })
    {
        double numDeriv = (k.f(r + h) - k.f(r - h))/(2.0*h);
        double dualDeriv = k.df(DualNumberd(r, 1.0)).getDerivative();
        checkClose(dualDeriv, numDeriv, 1e-4*(1.0 + std::abs(numDeriv)), k.name + "' at " + to_string(r));
    }
}

void testBranchGuards()
{
    // Values far from r = 1 must not be affected by the unused branches
    for (double r : { 1e-4, 0.01, 100.0, 1e4 })
    {
        for (auto &k : getKernels())
        {
            DualNumberd v = k.df(DualNumberd(r, 1.0));
            if (!std::isfinite(v.getValue()) || !std::isfinite(v.getDerivative()))
            {
                cout << "ERROR: non-finite result for " << k.name << " at " << r << endl;
                errCount++;
            }
        }
    }
    cout << "OK: checked branch guards" << endl;
}

int main(int argc, char *argv[])
{
    bool_t r = LOG.init(argv[0]);
    if (!r)
    {
        cerr << "ERROR: Can't initialize log: " << r.getErrorString() << endl;
        return -1;
    }

    for (auto &k : getKernels())
    {
        testBoundaryBatch(k);
        testContinuity(k);
        testDerivatives(k);
    }
    testBranchGuards();

    cout << "Detected " << errCount << " errors" << endl;
    return (errCount == 0)?0:-1;
}
