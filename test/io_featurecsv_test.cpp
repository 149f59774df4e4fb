#include "cgloc/io/FeatureCsv.hpp"
#include "test_common.hpp"

#include <iostream>
#include <sstream>
#include <string>

using namespace cgloc;

int main() {
    msg::FeatureTable t(2);
    t[0].x = 1.5f;  t[0].y = 2.25f; t[0].mass = 1000.0f; t[0].size = 1.25f; t[0].ecc = 0.5f;  t[0].frame = 0;
    t[1].x = 10.0f; t[1].y = 4.0f;  t[1].mass = 2000.0f; t[1].size = 2.0f;  t[1].ecc = 0.25f; t[1].frame = 3;

    // ---- Column order and header ----
    {
        std::ostringstream os;
        check(io::writeFeatureCsv(os, t, false), __LINE__);

        std::istringstream is(os.str());
        std::string line;
        std::getline(is, line);
        check(line == "x,y,mass,size,ecc", __LINE__);
        std::getline(is, line);
        check(line == "1.500000,2.250000,1000.000000,1.250000,0.500000", __LINE__);
    }
    {
        std::ostringstream os;
        check(io::writeFeatureCsv(os, t, true), __LINE__);

        std::istringstream is(os.str());
        std::string line;
        std::getline(is, line);
        check(line == "x,y,mass,size,ecc,frame", __LINE__);
        std::getline(is, line);
        std::getline(is, line);
        check(line == "10.000000,4.000000,2000.000000,2.000000,0.250000,3", __LINE__);
    }

    // ---- Positional access follows the canonical order ----
    check(msg::columnValue(t[0], msg::Column::X) == 1.5f, __LINE__);
    check(msg::columnValue(t[0], msg::Column::MASS) == 1000.0f, __LINE__);
    check(msg::columnValue(t[1], msg::Column::ECC) == 0.25f, __LINE__);

    // ---- Reading matches columns by name ----
    {
        std::istringstream is("frame,ecc,size,mass,y,x\n7,0.1,1.5,300,20.5,10.25\n");
        msg::FeatureTable r;
        check(io::readFeatureCsv(is, r), __LINE__);
        check(r.size() == 1, __LINE__);
        if (r.size() == 1) {
            check(r[0].x == 10.25f, __LINE__);
            check(r[0].y == 20.5f, __LINE__);
            check(r[0].mass == 300.0f, __LINE__);
            check(r[0].frame == 7, __LINE__);
        }
    }

    // ---- Written tables read back ----
    {
        std::stringstream ss;
        check(io::writeFeatureCsv(ss, t, true), __LINE__);
        msg::FeatureTable r;
        check(io::readFeatureCsv(ss, r), __LINE__);
        check(r.size() == 2, __LINE__);
        if (r.size() == 2) {
            check(r[1].x == t[1].x && r[1].ecc == t[1].ecc && r[1].frame == 3, __LINE__);
        }
    }

    // ---- Malformed input ----
    {
        std::istringstream missing_col("x,y,mass,size\n1,2,3,4\n");
        msg::FeatureTable r;
        check(!io::readFeatureCsv(missing_col, r), __LINE__);

        std::istringstream bad_number("x,y,mass,size,ecc\n1,2,abc,4,0\n");
        check(!io::readFeatureCsv(bad_number, r), __LINE__);
        check(r.empty(), __LINE__);

        std::istringstream empty("");
        check(!io::readFeatureCsv(empty, r), __LINE__);
    }

    return test_summary("io_featurecsv_test");
}
