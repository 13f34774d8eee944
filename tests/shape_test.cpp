#include <cassert>
#include <cmath>
#include <iostream>
#include "xylo/shape.hpp"

using namespace xylo;

static bool near(float a, float b){ return std::fabs(a-b) < 1e-4f; }

static void test_transforms(){
    auto sq = Shape::basic(ShapeKind::Square);
    auto moved = translate(sq, 2, 3);
    auto p = std::get<BasicShape>(moved->data).transform.map_point(0, 0);
    assert(near(p[0], 2) && near(p[1], 3));
    // setters copy, the original is untouched
    assert(std::get<BasicShape>(sq->data).transform.is_identity());

    auto spun = rotate(sq, 90);
    auto q = std::get<BasicShape>(spun->data).transform.map_point(1, 0);
    assert(near(q[0], 0) && near(q[1], 1));

    // scale then translate: translation is not scaled
    auto st = translate(scale(sq, 2, 2), 1, 0);
    auto r = std::get<BasicShape>(st->data).transform.map_point(1, 1);
    assert(near(r[0], 3) && near(r[1], 2));

    auto fill = Shape::basic(ShapeKind::Fill);
    assert(translate(fill, 5, 5) == fill);

    auto pivot = rotate_at(sq, 180, 1, 0);
    auto o = std::get<BasicShape>(pivot->data).transform.map_point(0, 0);
    assert(near(o[0], 2) && near(o[1], 0));
}

static void test_flatten_colors(){
    auto a = set_hsla(Shape::basic(ShapeKind::Square), 10.0f, 0.5f, std::nullopt, std::nullopt);
    auto b = Shape::basic(ShapeKind::Circle);
    auto both = Shape::composite(a, b);
    auto items = flatten(*both);
    assert(items.size()==2 && items[0].kind==ShapeKind::Square && items[1].kind==ShapeKind::Circle);
    assert(items[0].color.h==10.0f && items[0].color.s==0.5f);

    auto painted = set_hsla(both, 200.0f, std::nullopt, std::nullopt, std::nullopt);
    auto shifted = shift_hsla(painted, 5, 0, -0.25f, 0);
    auto out = flatten(*shifted);
    assert(out.size()==2);
    for(auto& item : out){ assert(item.color.h==205.0f); }
    assert(out[0].color.s==0.5f && out[1].color.s==1.0f);
    assert(near(out[1].color.l, 0.75f));

    // an inner overwrite beats an outer one
    auto inner = set_hsla(Shape::collection({b}), std::nullopt, std::nullopt, 0.2f, std::nullopt);
    auto outer = set_hsla(Shape::collection({inner}), std::nullopt, std::nullopt, 0.9f, std::nullopt);
    assert(near(flatten(*outer).at(0).color.l, 0.2f));

    auto green = set_hex(b, 0, 255, 0);
    auto g = flatten(*green).at(0).color;
    assert(near(g.h, 120) && near(g.s, 1) && near(g.l, 0.5f));
}

static void test_canvas(){
    auto sq = translate(Shape::basic(ShapeKind::Square), 10, 20);
    auto scene = Shape::collection({Shape::basic(ShapeKind::Fill), sq});
    auto items = flatten(*scene, 400, 300);
    assert(items.size()==2);
    assert(items[0].kind==ShapeKind::Fill && items[0].transform.is_identity());
    auto p = items[1].transform.map_point(0, 0);
    assert(near(p[0], 210) && near(p[1], 130));
    assert(flatten(*Shape::basic(ShapeKind::Empty)).empty());
}

static void test_zindex(){
    auto sq = Shape::basic(ShapeKind::Square);
    auto circle = Shape::basic(ShapeKind::Circle);
    auto tri = Shape::basic(ShapeKind::Triangle);

    // higher z paints later; equal z keeps graph order
    auto scene = Shape::collection({set_zindex(sq, 2), circle, tri});
    auto items = flatten(*scene);
    assert(items[0].kind==ShapeKind::Circle && items[1].kind==ShapeKind::Triangle && items[2].kind==ShapeKind::Square);
    assert(items[2].zindex == 2.0f);

    // an overwrite on a node replaces leaf values, shifts add up
    auto inner = set_zindex(Shape::composite(set_zindex(sq, 5), circle), 1);
    auto outer = shift_zindex(shift_zindex(Shape::collection({inner, tri}), 0.5f), 1);
    auto out = flatten(*outer);
    assert(out[0].kind==ShapeKind::Triangle && out[0].zindex==1.5f);
    assert(out[1].zindex==2.5f && out[2].zindex==2.5f);

    // setting an overwrite drops earlier shifts on the same node
    auto reset = set_zindex(shift_zindex(Shape::collection({sq}), 3), -1);
    assert(flatten(*reset).at(0).zindex == -1.0f);
    assert(*shift_zindex(sq, 1) != *sq);
    assert(to_string(*set_zindex(sq, 4)).find("z=4") != std::string::npos);
}

static void test_sharing(){
    auto leaf = Shape::basic(ShapeKind::Triangle);
    auto pair = Shape::composite(leaf, leaf);
    auto quad = Shape::composite(pair, pair);
    assert(shape_size(*quad) == 7);
    assert(flatten(*quad).size() == 4);
    assert(to_string(*pair).find("composite") == 0);
}

void run_shape_tests(){
    test_transforms();
    test_flatten_colors();
    test_canvas();
    test_zindex();
    test_sharing();
    std::cout << "Shape tests passed\n";
}
