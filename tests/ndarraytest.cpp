#include "ndarray.h"
#include "coordinates.h"
#include "constants.h"
#include "log.h"
#include <iostream>
#include <cmath>

using namespace halolens;
using namespace std;
using namespace errut;

int errCount = 0;

void checkFalse(bool_t r, const string &desc)
{
    if (r)
    {
        cout << "ERROR: expected failure for " << desc << endl;
        errCount++;
    }
    else
        cout << "OK: got expected failure for " << desc << ": " << r.getErrorString() << endl;
}

void checkTrue(bool_t r, const string &desc)
{
    if (!r)
    {
        cout << "ERROR: expected success for " << desc << ": " << r.getErrorString() << endl;
        errCount++;
    }
    else
        cout << "OK: got expected success for " << desc << endl;
}

void checkShape(const NDArrayd &a, const vector<size_t> &expected, const string &desc)
{
    if (a.getShape() != expected)
    {
        cout << "ERROR: expected shape " << NDArrayd::getShapeString(expected) << " for " << desc
             << " but found " << NDArrayd::getShapeString(a.getShape()) << endl;
        errCount++;
    }
    else
        cout << "OK: shape " << NDArrayd::getShapeString(expected) << " for " << desc << endl;
}

void checkValues(const NDArrayd &a, const vector<double> &expected, const string &desc, double tol = 0)
{
    bool ok = (a.getValues().size() == expected.size());
    for (size_t i = 0 ; ok && i < expected.size() ; i++)
    {
        if (std::abs(a[i] - expected[i]) > tol)
            ok = false;
    }

    if (!ok)
    {
        cout << "ERROR: unexpected values for " << desc << ":";
        for (auto v : a.getValues())
            cout << " " << v;
        cout << endl;
        errCount++;
    }
    else
        cout << "OK: values for " << desc << endl;
}

void testConstruction()
{
    NDArrayd s;
    checkShape(s, {}, "default array");
    checkValues(s, { 0 }, "default array");

    NDArrayd v(3.5);
    if (!v.isScalar() || v.getNumberOfElements() != 1)
    {
        cout << "ERROR: array from single value is not a scalar" << endl;
        errCount++;
    }
    else
        cout << "OK: array from single value is a scalar" << endl;

    NDArrayd a(vector<double>{ 1, 2, 3 });
    checkShape(a, { 3 }, "array from vector");

    NDArrayd b(vector<size_t>{ 2, 4 }, 1.5);
    checkShape(b, { 2, 4 }, "array from shape");
    if (b.getNumberOfElements() != 8 || b[7] != 1.5)
    {
        cout << "ERROR: array from shape is not filled correctly" << endl;
        errCount++;
    }

    NDArrayd c;
    checkFalse(NDArrayd::create({ 2, 3 }, { 1, 2, 3, 4, 5 }, c), "five values for shape (2,3)");
    checkTrue(NDArrayd::create({ 2, 3 }, { 1, 2, 3, 4, 5, 6 }, c), "six values for shape (2,3)");
    checkShape(c, { 2, 3 }, "created array");
}

void testBroadcasting()
{
    auto add = [](double a, double b) { return a + b; };
    NDArrayd col, row(vector<double>{ 10, 20, 30 }), result;

    checkTrue(NDArrayd::create({ 2, 1 }, { 1, 2 }, col), "column vector");
    checkTrue(elementWise(result, add, col, row), "broadcast (2,1) with (3)");
    checkShape(result, { 2, 3 }, "broadcast (2,1) with (3)");
    checkValues(result, { 11, 21, 31, 12, 22, 32 }, "broadcast (2,1) with (3)");

    checkTrue(elementWise(result, add, NDArrayd(100.0), row), "broadcast scalar with (3)");
    checkShape(result, { 3 }, "broadcast scalar with (3)");
    checkValues(result, { 110, 120, 130 }, "broadcast scalar with (3)");

    NDArrayd m;
    checkTrue(NDArrayd::create({ 2, 3 }, { 1, 2, 3, 4, 5, 6 }, m), "matrix");
    checkFalse(elementWise(result, add, m, NDArrayd(vector<double>{ 1, 2 })), "broadcast (2,3) with (2)");
    checkFalse(elementWise(result, add, NDArrayd(vector<double>{ 1, 2, 3 }), NDArrayd(vector<double>{ 1, 2 })), "broadcast (3) with (2)");

    vector<size_t> shape;
    checkTrue(getBroadcastShape(shape, NDArrayd(vector<size_t>{ 4, 1, 3 }), NDArrayd(vector<size_t>{ 5, 1 }), NDArrayd(2.0)),
              "shape of (4,1,3), (5,1) and a scalar");
    if (shape != vector<size_t>{ 4, 5, 3 })
    {
        cout << "ERROR: expected broadcast shape (4,5,3) but found " << NDArrayd::getShapeString(shape) << endl;
        errCount++;
    }
    else
        cout << "OK: broadcast shape is (4,5,3)" << endl;

    // The result may be one of the inputs
    checkTrue(elementWise(m, add, m, row), "in-place broadcast");
    checkValues(m, { 11, 22, 33, 14, 25, 36 }, "in-place broadcast");
}

void testTranslateRotate()
{
    double xt, yt;
    translateRotate(2.0, 1.0, 1.0, 1.0, 0, xt, yt);
    checkValues(NDArrayd(vector<double>{ xt, yt }), { 1, 0 }, "translation");

    translateRotate(2.0, 1.0, 1.0, 1.0, CONST_PI/2.0, xt, yt);
    checkValues(NDArrayd(vector<double>{ xt, yt }), { 0, -1 }, "rotation over 90 degrees", 1e-12);

    NDArrayd x(vector<double>{ 1, 2, 3 }), xOut, yOut;
    checkTrue(translateRotate(x, NDArrayd(0.0), NDArrayd(1.0), NDArrayd(vector<double>{ 0.5, 0.5, 0.5 }), xOut, yOut),
              "batched translation");
    checkValues(xOut, { 0, 1, 2 }, "batched translation x");
    checkValues(yOut, { -0.5, -0.5, -0.5 }, "batched translation y");

    checkFalse(translateRotate(x, NDArrayd(vector<double>{ 1, 2 }), NDArrayd(0.0), NDArrayd(0.0), xOut, yOut),
               "translation of incompatible shapes");
}

int main(int argc, char *argv[])
{
    bool_t r = LOG.init(argv[0]);
    if (!r)
    {
        cerr << "ERROR: Can't initialize log: " << r.getErrorString() << endl;
        return -1;
    }

    testConstruction();
    testBroadcasting();
    testTranslateRotate();

    cout << "Detected " << errCount << " errors" << endl;
    return (errCount == 0)?0:-1;
}
